/**
 * @file tflite_classifier.hpp
 * @brief TensorFlow Lite sequence classifier for sign gestures
 *
 * Runs a pre-trained sequence model (input [1, steps, features] float32,
 * output [1, num_classes] probabilities) through the TFLite interpreter.
 */

#pragma once

#include "classifier.hpp"
#include <memory>
#include <string>
#include <vector>

namespace signrec {
namespace tflite {

/**
 * @brief TensorFlow Lite classifier configuration
 */
struct TFLiteConfig {
    std::string model_path{"models/gesture_model.tflite"};

    // Hardware acceleration
    int num_threads{2};        // Interpreter CPU threads
    bool use_xnnpack{true};    // XNNPACK delegate when compiled in

    // Logging
    bool verbose{false};
};

// Forward declaration
struct TFLiteClassifierImpl;

/**
 * @brief Sequence classifier backed by a .tflite model
 *
 * init() loads the model and checks the tensor layout; infer() copies the
 * window into input 0, invokes the interpreter and returns output 0.
 */
class TFLiteClassifier : public Classifier {
public:
    TFLiteClassifier();
    ~TFLiteClassifier() override;

    /**
     * @brief Load model and allocate tensors
     * @param config Configuration settings
     * @return true if successful, false otherwise (see last_error())
     */
    bool init(const TFLiteConfig& config);

    /**
     * @brief Run one inference
     * @throws std::runtime_error if not initialized, the window does not match
     *         the input tensor, or the interpreter fails
     */
    std::vector<float> infer(const std::vector<float>& window,
                             size_t steps, size_t features) override;

    size_t num_classes() const override;
    std::string name() const override { return "tflite"; }

    // Input tensor layout read at init(), 0 when unknown
    size_t input_steps() const;
    size_t input_features() const;

    const std::string& last_error() const { return last_error_; }

    /**
     * @brief Check if TFLite support is compiled in
     * @return true if TFLite is available
     */
    static bool is_available();

private:
    std::unique_ptr<TFLiteClassifierImpl> impl_;
    std::string last_error_;

    // Disable copy
    TFLiteClassifier(const TFLiteClassifier&) = delete;
    TFLiteClassifier& operator=(const TFLiteClassifier&) = delete;
};

} // namespace tflite
} // namespace signrec

#pragma once

#include "classifier.hpp"
#include "inference_worker.hpp"
#include "label_set.hpp"
#include "recognizer_config.hpp"
#include "sample_window.hpp"
#include <memory>
#include <string>
#include <vector>

namespace signrec {

// Output of one classifier call on a full window
struct Prediction {
    std::string label;
    int label_index{-1};
    float confidence{0.0f};
};

enum class InferenceStatus {
    ACCEPTED,       // confidence >= min_confidence
    LOW_CONFIDENCE, // valid prediction, discarded by the gate
    FAILED          // classifier error, malformed output or timeout
};

struct InferenceResult {
    InferenceStatus status{InferenceStatus::FAILED};
    Prediction prediction;
    std::vector<float> probabilities;
    std::string error;
    double inference_ms{0.0};
};

// Wraps the external classifier: snapshots the window, checks the output
// contract, takes the argmax and applies the confidence gate.
// Never throws; failures come back as InferenceStatus::FAILED.
class InferenceAdapter {
public:
    InferenceAdapter(Classifier& classifier, const LabelSet& labels,
                     const RecognizerConfig& config);
    ~InferenceAdapter();

    // Precondition: window.is_full()
    InferenceResult run(const SampleWindow& window);

    void set_min_confidence(float min_confidence) { min_confidence_ = min_confidence; }
    float min_confidence() const { return min_confidence_; }

    uint64_t stale_results() const;

    // Contract check on a raw probability vector; empty string when valid
    static std::string check_probabilities(const std::vector<float>& probabilities,
                                           size_t expected_classes);

private:
    Classifier& classifier_;
    const LabelSet& labels_;
    float min_confidence_;
    int timeout_ms_;
    std::unique_ptr<InferenceWorker> worker_;

    // Disable copy
    InferenceAdapter(const InferenceAdapter&) = delete;
    InferenceAdapter& operator=(const InferenceAdapter&) = delete;
};

} // namespace signrec

/**
 * @file tflite_classifier.cpp
 * @brief TensorFlow Lite sequence classifier for sign gestures
 *
 * Features:
 * - Input layout check at load time ([1, steps, features] float32)
 * - XNNPACK delegate when compiled with USE_XNNPACK
 * - Exceptions on any per-call failure so the caller can skip the frame
 */

#include "tflite_classifier.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <cstring>

#ifdef HAVE_TFLITE
#include <tensorflow/lite/interpreter.h>
#include <tensorflow/lite/kernels/register.h>
#include <tensorflow/lite/model.h>

#ifdef USE_XNNPACK
#include <tensorflow/lite/delegates/xnnpack/xnnpack_delegate.h>
#endif
#endif

namespace signrec {
namespace tflite {

struct TFLiteClassifierImpl {
    bool initialized = false;
    TFLiteConfig config;
    size_t steps = 0;
    size_t features = 0;
    size_t classes = 0;
#ifdef HAVE_TFLITE
    // Declaration order matters: the interpreter must go before the
    // delegate it uses, and both before the model.
    std::unique_ptr<::tflite::FlatBufferModel> model;
#ifdef USE_XNNPACK
    std::unique_ptr<TfLiteDelegate, void (*)(TfLiteDelegate*)> delegate{nullptr, TfLiteXNNPackDelegateDelete};
#endif
    std::unique_ptr<::tflite::Interpreter> interpreter;
#endif
};

TFLiteClassifier::TFLiteClassifier() : impl_(std::make_unique<TFLiteClassifierImpl>()) {}
TFLiteClassifier::~TFLiteClassifier() = default;

bool TFLiteClassifier::init(const TFLiteConfig& config) {
    impl_ = std::make_unique<TFLiteClassifierImpl>();
    impl_->config = config;
    last_error_.clear();
#ifndef HAVE_TFLITE
    last_error_ = "TFLite support not compiled in";
    std::cerr << "[TFLite] " << last_error_ << "\n";
    return false;
#else
    impl_->model = ::tflite::FlatBufferModel::BuildFromFile(config.model_path.c_str());
    if (!impl_->model) {
        last_error_ = "failed to load model: " + config.model_path;
        std::cerr << "[TFLite] " << last_error_ << "\n";
        return false;
    }

    ::tflite::ops::builtin::BuiltinOpResolver resolver;
    ::tflite::InterpreterBuilder builder(*impl_->model, resolver);
    builder(&impl_->interpreter);
    if (!impl_->interpreter) {
        last_error_ = "failed to create interpreter";
        std::cerr << "[TFLite] " << last_error_ << "\n";
        return false;
    }
    if (config.num_threads > 0) {
        impl_->interpreter->SetNumThreads(config.num_threads);
    }

#ifdef USE_XNNPACK
    if (config.use_xnnpack) {
        TfLiteXNNPackDelegateOptions opts = TfLiteXNNPackDelegateOptionsDefault();
        opts.num_threads = config.num_threads > 0 ? config.num_threads : 1;
        impl_->delegate.reset(TfLiteXNNPackDelegateCreate(&opts));
        if (impl_->delegate &&
            impl_->interpreter->ModifyGraphWithDelegate(impl_->delegate.get()) != kTfLiteOk) {
            // Recurrent ops are often not delegated; CPU kernels still work
            std::cerr << "[TFLite] XNNPACK delegate rejected, running on CPU kernels\n";
        }
    }
#endif

    if (impl_->interpreter->AllocateTensors() != kTfLiteOk) {
        last_error_ = "failed to allocate tensors";
        std::cerr << "[TFLite] " << last_error_ << "\n";
        return false;
    }

    const TfLiteTensor* input = impl_->interpreter->input_tensor(0);
    if (!input || input->type != kTfLiteFloat32 || input->dims->size != 3) {
        last_error_ = "model input must be float32 [1, steps, features]";
        std::cerr << "[TFLite] " << last_error_ << "\n";
        return false;
    }
    impl_->steps = static_cast<size_t>(input->dims->data[1]);
    impl_->features = static_cast<size_t>(input->dims->data[2]);

    const TfLiteTensor* output = impl_->interpreter->output_tensor(0);
    if (!output || output->type != kTfLiteFloat32 || output->dims->size < 1) {
        last_error_ = "model output must be float32 [1, num_classes]";
        std::cerr << "[TFLite] " << last_error_ << "\n";
        return false;
    }
    impl_->classes = static_cast<size_t>(output->dims->data[output->dims->size - 1]);

    if (config.verbose) {
        std::cerr << "[TFLite] Loaded " << config.model_path
                  << " input=[1," << impl_->steps << "," << impl_->features << "]"
                  << " classes=" << impl_->classes << "\n";
    }

    impl_->initialized = true;
    return true;
#endif
}

std::vector<float> TFLiteClassifier::infer(const std::vector<float>& window,
                                           size_t steps, size_t features) {
#ifndef HAVE_TFLITE
    (void)window;
    (void)steps;
    (void)features;
    throw std::runtime_error("TFLite support not compiled in");
#else
    if (!impl_->initialized) {
        throw std::runtime_error("TFLite classifier not initialized");
    }
    if (steps != impl_->steps || features != impl_->features ||
        window.size() != steps * features) {
        std::ostringstream oss;
        oss << "input shape [" << steps << "," << features << "] (" << window.size()
            << " values) does not match model [" << impl_->steps << "," << impl_->features << "]";
        throw std::runtime_error(oss.str());
    }

    float* input = impl_->interpreter->typed_input_tensor<float>(0);
    std::memcpy(input, window.data(), window.size() * sizeof(float));

    if (impl_->interpreter->Invoke() != kTfLiteOk) {
        throw std::runtime_error("TFLite Invoke failed");
    }

    const float* output = impl_->interpreter->typed_output_tensor<float>(0);
    return std::vector<float>(output, output + impl_->classes);
#endif
}

bool TFLiteClassifier::is_available() {
#ifdef HAVE_TFLITE
    return true;
#else
    return false;
#endif
}

size_t TFLiteClassifier::num_classes() const { return impl_->classes; }
size_t TFLiteClassifier::input_steps() const { return impl_->steps; }
size_t TFLiteClassifier::input_features() const { return impl_->features; }

} // namespace tflite
} // namespace signrec

#include <gtest/gtest.h>
#include "tflite_classifier.hpp"
#include <stdexcept>

using namespace signrec;

// Missing model file fails init with a reason, whether or not TFLite is compiled in
TEST(TFLiteClassifierTest, MissingModelFailsInit) {
    tflite::TFLiteConfig config;
    config.model_path = "no_such_model.tflite";

    tflite::TFLiteClassifier classifier;
    EXPECT_FALSE(classifier.init(config));
    EXPECT_FALSE(classifier.last_error().empty());
    EXPECT_EQ(classifier.input_steps(), 0u);
    EXPECT_EQ(classifier.num_classes(), 0u);
}

// Inference before a successful init throws
TEST(TFLiteClassifierTest, InferWithoutModelThrows) {
    tflite::TFLiteClassifier classifier;
    std::vector<float> window(30 * 126, 0.0f);
    EXPECT_THROW(classifier.infer(window, 30, 126), std::runtime_error);
}

TEST(TFLiteClassifierTest, Name) {
    tflite::TFLiteClassifier classifier;
    EXPECT_EQ(classifier.name(), "tflite");
}

// Without TFLite compiled into the library, init always reports why
TEST(TFLiteClassifierTest, AvailabilityMatchesInit) {
    tflite::TFLiteClassifier classifier;
    tflite::TFLiteConfig config;
    config.model_path = "no_such_model.tflite";
    EXPECT_FALSE(classifier.init(config));
    if (!tflite::TFLiteClassifier::is_available()) {
        EXPECT_EQ(classifier.last_error(), "TFLite support not compiled in");
    } else {
        EXPECT_NE(classifier.last_error(), "TFLite support not compiled in");
    }
}

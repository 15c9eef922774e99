#include <gtest/gtest.h>
#include "recognizer_config.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace signrec;

class RecognizerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = "test_recognizer_config.tmp";
    }

    void TearDown() override {
        std::remove(path.c_str());
        unsetenv("SIGNREC_MIN_CONFIDENCE");
        unsetenv("SIGNREC_WINDOW_CAPACITY");
        unsetenv("SIGNREC_RESET_THRESHOLD");
        unsetenv("SIGNREC_HISTORY_SIZE");
    }

    void write(const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    std::string path;
};

TEST_F(RecognizerConfigTest, DefaultsAreValid) {
    RecognizerConfig config;
    EXPECT_EQ(config.window_capacity, 30);
    EXPECT_EQ(config.feature_dim, 126);
    EXPECT_FLOAT_EQ(config.min_confidence, 0.7f);
    EXPECT_EQ(config.reset_threshold, 10);
    EXPECT_EQ(config.vote_history_size, 15);
    EXPECT_EQ(config.inference_timeout_ms, 0);
    EXPECT_TRUE(config.validate());
    EXPECT_TRUE(config.describe_invalid().empty());
}

TEST_F(RecognizerConfigTest, InvalidValues) {
    RecognizerConfig config;
    config.window_capacity = 0;
    EXPECT_FALSE(config.validate());

    config = RecognizerConfig{};
    config.min_confidence = -0.1f;
    EXPECT_FALSE(config.validate());

    config = RecognizerConfig{};
    config.max_hands = 1; // feature_dim still 126
    EXPECT_FALSE(config.validate());
    EXPECT_NE(config.describe_invalid().find("feature_dim"), std::string::npos);
    config.feature_dim = 63;
    EXPECT_TRUE(config.validate());

    config = RecognizerConfig{};
    config.vote_history_size = 0;
    EXPECT_FALSE(config.validate());
}

// NaN threshold would disable the confidence gate
TEST_F(RecognizerConfigTest, NanConfidenceIsInvalid) {
    RecognizerConfig config;
    config.min_confidence = std::nanf("");
    EXPECT_FALSE(config.validate());
    EXPECT_NE(config.describe_invalid().find("min_confidence"), std::string::npos);
}

TEST_F(RecognizerConfigTest, LoadFromFile) {
    write("# recognizer\n"
          "window_capacity 20\n"
          "min_confidence 0.85\n"
          "\n"
          "reset_threshold 5\n"
          "unknown_key 1\n");
    RecognizerConfig config;
    ASSERT_TRUE(config.load_from_file(path));
    EXPECT_EQ(config.window_capacity, 20);
    EXPECT_FLOAT_EQ(config.min_confidence, 0.85f);
    EXPECT_EQ(config.reset_threshold, 5);
    EXPECT_EQ(config.vote_history_size, 15);
}

TEST_F(RecognizerConfigTest, LoadRejectsBadValue) {
    write("window_capacity lots\n");
    RecognizerConfig config;
    EXPECT_FALSE(config.load_from_file(path));
}

TEST_F(RecognizerConfigTest, LoadRejectsInvalidResult) {
    write("min_confidence 2.0\n");
    RecognizerConfig config;
    EXPECT_FALSE(config.load_from_file(path));
}

TEST_F(RecognizerConfigTest, MissingFile) {
    RecognizerConfig config;
    EXPECT_FALSE(config.load_from_file("does_not_exist.cfg"));
}

TEST_F(RecognizerConfigTest, SaveThenLoad) {
    RecognizerConfig saved;
    saved.window_capacity = 12;
    saved.vote_history_size = 7;
    saved.inference_timeout_ms = 250;
    ASSERT_TRUE(saved.save_to_file(path));

    RecognizerConfig loaded;
    ASSERT_TRUE(loaded.load_from_file(path));
    EXPECT_EQ(loaded.window_capacity, 12);
    EXPECT_EQ(loaded.vote_history_size, 7);
    EXPECT_EQ(loaded.inference_timeout_ms, 250);
}

TEST_F(RecognizerConfigTest, EnvironmentOverrides) {
    setenv("SIGNREC_MIN_CONFIDENCE", "0.8", 1);
    setenv("SIGNREC_WINDOW_CAPACITY", "24", 1);
    setenv("SIGNREC_RESET_THRESHOLD", "abc", 1);

    RecognizerConfig config;
    config.apply_env_overrides();
    EXPECT_FLOAT_EQ(config.min_confidence, 0.8f);
    EXPECT_EQ(config.window_capacity, 24);
    EXPECT_EQ(config.reset_threshold, 10); // unparsable value ignored
}

TEST_F(RecognizerConfigTest, EnvironmentRejectsNonFiniteConfidence) {
    setenv("SIGNREC_MIN_CONFIDENCE", "nan", 1);
    RecognizerConfig config;
    config.apply_env_overrides();
    EXPECT_FLOAT_EQ(config.min_confidence, 0.7f);

    setenv("SIGNREC_MIN_CONFIDENCE", "inf", 1);
    config.apply_env_overrides();
    EXPECT_FLOAT_EQ(config.min_confidence, 0.7f);
    EXPECT_TRUE(config.validate());
}

// Values that do not fit in an int are ignored instead of wrapping
TEST_F(RecognizerConfigTest, EnvironmentRejectsOutOfRangeIntegers) {
    setenv("SIGNREC_WINDOW_CAPACITY", "4294967326", 1);
    setenv("SIGNREC_RESET_THRESHOLD", "-4294967286", 1);
    setenv("SIGNREC_HISTORY_SIZE", "99999999999999999999999", 1);

    RecognizerConfig config;
    config.apply_env_overrides();
    EXPECT_EQ(config.window_capacity, 30);
    EXPECT_EQ(config.reset_threshold, 10);
    EXPECT_EQ(config.vote_history_size, 15);
}

TEST(RecognitionStatsTest, Reset) {
    RecognitionStats stats;
    stats.frames_processed = 10;
    stats.gestures_recognized = 2;
    stats.avg_inference_ms = 3.5;
    stats.reset();
    EXPECT_EQ(stats.frames_processed, 0u);
    EXPECT_EQ(stats.gestures_recognized, 0u);
    EXPECT_DOUBLE_EQ(stats.avg_inference_ms, 0.0);
}

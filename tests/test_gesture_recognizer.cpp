#include <gtest/gtest.h>
#include "gesture_recognizer.hpp"
#include "test_helpers.hpp"
#include <cmath>
#include <iostream>

using namespace signrec;
using signrec::fakes::ScriptedClassifier;
using signrec::fakes::ThrowingClassifier;
using signrec::fakes::one_hand;

class GestureRecognizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        labels = LabelSet({"A", "B"});
        config.window_capacity = 4;
        config.vote_history_size = 3;
        config.reset_threshold = 2;
        config.min_confidence = 0.6f;
    }

    // Feed n frames with a hand, return the last event
    RecognitionEvent feed_present(GestureRecognizer& rec, int n) {
        RecognitionEvent last;
        for (int i = 0; i < n; ++i) last = rec.process_frame(one_hand());
        return last;
    }

    RecognitionEvent feed_absent(GestureRecognizer& rec, int n) {
        RecognitionEvent last;
        for (int i = 0; i < n; ++i) last = rec.process_frame(Hands{});
        return last;
    }

    LabelSet labels;
    RecognizerConfig config;
};

// Full session: emission, hold, absence reset, new gesture
TEST_F(GestureRecognizerTest, SessionScenario) {
    ScriptedClassifier classifier;
    classifier.set({0.9f, 0.1f});
    GestureRecognizer rec;
    ASSERT_TRUE(rec.init(config, classifier, labels));

    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(rec.process_frame(one_hand()).is_none());
    }
    EXPECT_EQ(classifier.calls, 0);

    RecognitionEvent e = rec.process_frame(one_hand());
    ASSERT_TRUE(e.is_recognized());
    EXPECT_EQ(e.label, "A");
    EXPECT_FLOAT_EQ(e.confidence, 0.9f);
    EXPECT_EQ(classifier.calls, 1);
    EXPECT_EQ(rec.window_size(), 0u);
    EXPECT_EQ(rec.history_size(), 0u);

    // Holding A: window refills and slides, nothing new is emitted
    for (int i = 0; i < 6; ++i) {
        EXPECT_TRUE(rec.process_frame(one_hand()).is_none());
    }
    EXPECT_EQ(classifier.calls, 4);
    EXPECT_TRUE(rec.window_full());

    // Hands gone: cleared on the third absent frame
    EXPECT_TRUE(rec.process_frame(Hands{}).is_none());
    EXPECT_TRUE(rec.process_frame(Hands{}).is_none());
    EXPECT_EQ(rec.window_size(), 4u);
    EXPECT_TRUE(rec.process_frame(Hands{}).is_none());
    EXPECT_EQ(rec.window_size(), 0u);
    EXPECT_EQ(rec.history_size(), 0u);
    ASSERT_TRUE(rec.last_emitted().has_value());
    EXPECT_EQ(*rec.last_emitted(), "A");

    classifier.set({0.2f, 0.8f});
    EXPECT_TRUE(feed_present(rec, 3).is_none());
    e = rec.process_frame(one_hand());
    ASSERT_TRUE(e.is_recognized());
    EXPECT_EQ(e.label, "B");
    EXPECT_FLOAT_EQ(e.confidence, 0.8f);

    const RecognitionStats& stats = rec.get_stats();
    EXPECT_EQ(stats.gestures_recognized, 2u);
    EXPECT_EQ(stats.absence_resets, 1u);
    EXPECT_EQ(stats.frames_processed, 17u);
    EXPECT_EQ(stats.frames_with_hands, 14u);
}

// Same gesture after an absence reset is still debounced
TEST_F(GestureRecognizerTest, AbsenceKeepsLastEmitted) {
    ScriptedClassifier classifier;
    classifier.set({0.9f, 0.1f});
    GestureRecognizer rec;
    ASSERT_TRUE(rec.init(config, classifier, labels));

    EXPECT_TRUE(feed_present(rec, 4).is_recognized());
    feed_absent(rec, 5);
    EXPECT_TRUE(feed_present(rec, 4).is_none());
}

// reset() forgets the last emission, so the same gesture fires again
TEST_F(GestureRecognizerTest, SessionResetAllowsRepeat) {
    ScriptedClassifier classifier;
    classifier.set({0.9f, 0.1f});
    GestureRecognizer rec;
    ASSERT_TRUE(rec.init(config, classifier, labels));

    EXPECT_TRUE(feed_present(rec, 4).is_recognized());
    feed_present(rec, 2);
    rec.reset();
    EXPECT_EQ(rec.window_size(), 0u);
    EXPECT_FALSE(rec.last_emitted().has_value());
    EXPECT_EQ(rec.absent_frames(), 0u);

    RecognitionEvent e = feed_present(rec, 4);
    ASSERT_TRUE(e.is_recognized());
    EXPECT_EQ(e.label, "A");
}

// Absent frames never push samples into the window
TEST_F(GestureRecognizerTest, AbsentFramesDoNotFillWindow) {
    ScriptedClassifier classifier;
    classifier.set({0.9f, 0.1f});
    GestureRecognizer rec;
    ASSERT_TRUE(rec.init(config, classifier, labels));

    feed_present(rec, 2);
    feed_absent(rec, 2);
    EXPECT_EQ(rec.window_size(), 2u);
    EXPECT_EQ(rec.absent_frames(), 2u);
    feed_present(rec, 1);
    EXPECT_EQ(rec.absent_frames(), 0u);
    EXPECT_EQ(rec.window_size(), 3u);
    EXPECT_EQ(classifier.calls, 0);
}

// Below the gate nothing reaches the vote history
TEST_F(GestureRecognizerTest, LowConfidenceNeverEmits) {
    ScriptedClassifier classifier;
    classifier.set({0.55f, 0.45f});
    GestureRecognizer rec;
    ASSERT_TRUE(rec.init(config, classifier, labels));

    EXPECT_TRUE(feed_present(rec, 10).is_none());
    EXPECT_EQ(rec.history_size(), 0u);
    EXPECT_EQ(rec.get_stats().low_confidence_discards, 7u);

    // Lowering the gate at runtime lets it through
    ASSERT_TRUE(rec.set_min_confidence(0.5f));
    RecognitionEvent e = rec.process_frame(one_hand());
    ASSERT_TRUE(e.is_recognized());
    EXPECT_EQ(e.label, "A");
    EXPECT_FALSE(rec.set_min_confidence(1.5f));
}

// Majority vote smooths over a single outlier
TEST_F(GestureRecognizerTest, VoteSmoothsOutlier) {
    ScriptedClassifier classifier;
    classifier.push({0.9f, 0.1f});
    classifier.push({0.9f, 0.1f});
    classifier.push({0.1f, 0.9f});
    classifier.push({0.9f, 0.1f});
    GestureRecognizer rec;
    ASSERT_TRUE(rec.init(config, classifier, labels));

    ASSERT_TRUE(feed_present(rec, 4).is_recognized());
    // Fresh window, then history A, B, A: the lone B never wins
    for (int i = 0; i < 6; ++i) {
        EXPECT_TRUE(rec.process_frame(one_hand()).is_none());
    }
    EXPECT_EQ(classifier.calls, 4);
    EXPECT_EQ(rec.vote_history().count("B"), 1u);
    EXPECT_EQ(rec.vote_history().resolve(), "A");
}

// Classifier failure: ERROR event, no state change besides the frame
TEST_F(GestureRecognizerTest, InferenceFailureSkipsFrame) {
    ThrowingClassifier classifier;
    GestureRecognizer rec;
    ASSERT_TRUE(rec.init(config, classifier, labels));

    feed_present(rec, 3);
    RecognitionEvent e = rec.process_frame(one_hand());
    ASSERT_TRUE(e.is_error());
    EXPECT_FALSE(e.reason.empty());
    EXPECT_EQ(rec.history_size(), 0u);
    EXPECT_TRUE(rec.window_full());
    EXPECT_FALSE(rec.last_emitted().has_value());
    EXPECT_EQ(rec.get_stats().inference_failures, 1u);

    // Next frame retries
    EXPECT_TRUE(rec.process_frame(one_hand()).is_error());
    EXPECT_EQ(classifier.calls, 2);
}

TEST_F(GestureRecognizerTest, MalformedOutputIsError) {
    ScriptedClassifier classifier;
    classifier.set({0.9f, 0.1f, 0.0f});
    GestureRecognizer rec;
    ASSERT_TRUE(rec.init(config, classifier, labels));
    EXPECT_TRUE(feed_present(rec, 4).is_error());
}

// A NaN threshold is rejected at init and at runtime; the gate stays on
TEST_F(GestureRecognizerTest, NanConfidenceRejected) {
    ScriptedClassifier classifier;
    classifier.set({0.55f, 0.45f});
    GestureRecognizer rec;

    RecognizerConfig bad = config;
    bad.min_confidence = std::nanf("");
    EXPECT_FALSE(rec.init(bad, classifier, labels));
    EXPECT_TRUE(rec.process_frame(one_hand()).is_error());

    ASSERT_TRUE(rec.init(config, classifier, labels));
    EXPECT_FALSE(rec.set_min_confidence(std::nanf("")));
    EXPECT_FLOAT_EQ(rec.get_config().min_confidence, 0.6f);
    EXPECT_TRUE(feed_present(rec, 5).is_none());
    EXPECT_EQ(rec.history_size(), 0u);
    EXPECT_EQ(rec.get_stats().low_confidence_discards, 2u);
}

TEST_F(GestureRecognizerTest, ResetStatsKeepsSessionState) {
    ScriptedClassifier classifier;
    classifier.set({0.9f, 0.1f});
    GestureRecognizer rec;
    ASSERT_TRUE(rec.init(config, classifier, labels));

    EXPECT_TRUE(feed_present(rec, 4).is_recognized());
    rec.reset_stats();
    EXPECT_EQ(rec.get_stats().frames_processed, 0u);
    EXPECT_EQ(rec.get_stats().gestures_recognized, 0u);
    ASSERT_TRUE(rec.last_emitted().has_value());
    EXPECT_EQ(*rec.last_emitted(), "A");
}

// Verbose logging leaves std::cerr formatting as it found it
TEST_F(GestureRecognizerTest, VerboseLoggingKeepsStreamFormat) {
    ScriptedClassifier classifier;
    classifier.push({0.55f, 0.45f});
    classifier.push({0.9f, 0.1f});
    config.verbose = true;
    GestureRecognizer rec;
    ASSERT_TRUE(rec.init(config, classifier, labels));

    const std::ios_base::fmtflags flags = std::cerr.flags();
    const std::streamsize precision = std::cerr.precision();

    EXPECT_TRUE(feed_present(rec, 4).is_none());           // discarded, logged
    EXPECT_TRUE(rec.process_frame(one_hand()).is_recognized()); // recognized, logged

    EXPECT_EQ(std::cerr.flags(), flags);
    EXPECT_EQ(std::cerr.precision(), precision);
}

TEST_F(GestureRecognizerTest, UninitializedReportsError) {
    GestureRecognizer rec;
    EXPECT_FALSE(rec.is_initialized());
    EXPECT_TRUE(rec.process_frame(one_hand()).is_error());
}

TEST_F(GestureRecognizerTest, InitRejectsBadConfig) {
    ScriptedClassifier classifier;
    GestureRecognizer rec;

    RecognizerConfig bad = config;
    bad.feature_dim = 100;
    EXPECT_FALSE(rec.init(bad, classifier, labels));
    EXPECT_FALSE(rec.last_error().empty());

    bad = config;
    bad.min_confidence = 1.2f;
    EXPECT_FALSE(rec.init(bad, classifier, labels));

    EXPECT_FALSE(rec.init(config, classifier, LabelSet()));
}

// Model class count must match the label set
TEST_F(GestureRecognizerTest, InitRejectsClassCountMismatch) {
    ScriptedClassifier classifier(3);
    GestureRecognizer rec;
    EXPECT_FALSE(rec.init(config, classifier, labels));

    ScriptedClassifier matching(2);
    EXPECT_TRUE(rec.init(config, matching, labels));
}

namespace {

// Calls back into the recognizer from inside inference
class ReentrantClassifier : public Classifier {
public:
    std::vector<float> infer(const std::vector<float>&, size_t, size_t) override {
        if (recognizer) inner = recognizer->process_frame(one_hand());
        return {1.0f, 0.0f};
    }
    std::string name() const override { return "reentrant"; }

    GestureRecognizer* recognizer{nullptr};
    RecognitionEvent inner;
};

} // namespace

TEST_F(GestureRecognizerTest, ConcurrentCallIsRejected) {
    ReentrantClassifier classifier;
    GestureRecognizer rec;
    ASSERT_TRUE(rec.init(config, classifier, labels));
    classifier.recognizer = &rec;

    RecognitionEvent outer = feed_present(rec, 4);
    EXPECT_TRUE(outer.is_recognized());
    EXPECT_TRUE(classifier.inner.is_error());
    EXPECT_EQ(rec.get_stats().frames_processed, 4u);
}

TEST(RecognitionEventTest, TypeNames) {
    EXPECT_EQ(GestureRecognizer::event_type_to_string(EventType::NONE), "NONE");
    EXPECT_EQ(GestureRecognizer::event_type_to_string(EventType::RECOGNIZED), "RECOGNIZED");
    EXPECT_EQ(GestureRecognizer::event_type_to_string(EventType::ERROR), "ERROR");
}

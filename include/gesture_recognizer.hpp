#pragma once

#include "classifier.hpp"
#include "emission_controller.hpp"
#include "inference_adapter.hpp"
#include "label_set.hpp"
#include "pose_encoder.hpp"
#include "presence_tracker.hpp"
#include "recognizer_config.hpp"
#include "sample_window.hpp"
#include "vote_smoother.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace signrec {

enum class EventType {
    NONE,        // nothing to report this frame
    RECOGNIZED,  // a new stabilized gesture
    ERROR        // inference failed or recognizer unusable; state untouched
};

// Exactly one per processed frame
struct RecognitionEvent {
    EventType type{EventType::NONE};
    std::string label;       // RECOGNIZED only
    float confidence{0.0f};  // RECOGNIZED only
    std::string reason;      // ERROR only

    static RecognitionEvent none() { return RecognitionEvent{}; }
    static RecognitionEvent recognized(const std::string& label, float confidence) {
        RecognitionEvent e;
        e.type = EventType::RECOGNIZED;
        e.label = label;
        e.confidence = confidence;
        return e;
    }
    static RecognitionEvent error(const std::string& reason) {
        RecognitionEvent e;
        e.type = EventType::ERROR;
        e.reason = reason;
        return e;
    }

    bool is_none() const { return type == EventType::NONE; }
    bool is_recognized() const { return type == EventType::RECOGNIZED; }
    bool is_error() const { return type == EventType::ERROR; }
};

// Per-session streaming recognizer.
//
// Per frame: presence tracking and pose encoding, inference when the window
// is full, then majority vote and debounce. Not thread-safe: one
// process_frame() at a time per instance; a concurrent call gets an ERROR
// event and leaves state alone.
class GestureRecognizer {
public:
    GestureRecognizer();
    ~GestureRecognizer();

    // Validate config against the label set and classifier. The classifier
    // must outlive the recognizer; labels are copied.
    // Returns false on configuration error (see last_error()).
    bool init(const RecognizerConfig& config, Classifier& classifier, const LabelSet& labels);

    // Run one frame. hands may be empty (no detection).
    RecognitionEvent process_frame(const Hands& hands);

    // Session reset: window, vote history, absence counter and last emission
    void reset();

    bool is_initialized() const { return initialized_; }
    const RecognizerConfig& get_config() const { return config_; }

    // Adjust the confidence gate at runtime
    bool set_min_confidence(float min_confidence);

    // State for overlays and diagnostics
    size_t window_size() const { return window_ ? window_->size() : 0; }
    bool window_full() const { return window_ && window_->is_full(); }
    uint64_t absent_frames() const { return presence_.absent_frames(); }
    size_t history_size() const { return smoother_.size(); }
    const std::optional<std::string>& last_emitted() const { return emission_.last_emitted(); }
    float last_confidence() const { return last_confidence_; }
    const VoteSmoother& vote_history() const { return smoother_; }

    const RecognitionStats& get_stats() const { return stats_; }
    void reset_stats() { stats_.reset(); }

    const std::string& last_error() const { return last_error_; }

    static std::string event_type_to_string(EventType type);

private:
    void clear_evidence();
    void record_inference_time(double ms);

    RecognizerConfig config_;
    LabelSet labels_;
    Classifier* classifier_{nullptr};
    bool initialized_{false};
    std::string last_error_;

    PoseEncoder encoder_;
    std::unique_ptr<SampleWindow> window_;
    PresenceTracker presence_;
    VoteSmoother smoother_;
    EmissionController emission_;
    std::unique_ptr<InferenceAdapter> adapter_;

    float last_confidence_{0.0f};
    RecognitionStats stats_;
    std::atomic<bool> in_frame_{false};

    // Disable copy
    GestureRecognizer(const GestureRecognizer&) = delete;
    GestureRecognizer& operator=(const GestureRecognizer&) = delete;
};

} // namespace signrec

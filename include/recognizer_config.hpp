#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace signrec {

// Named constants for the landmark layout
namespace constants {
    constexpr int kLandmarksPerHand = 21;
    constexpr int kCoordsPerLandmark = 3;
    constexpr int kMaxHands = 2;
    constexpr int kValuesPerHand = kLandmarksPerHand * kCoordsPerLandmark;
    constexpr int kFeatureDim = kValuesPerHand * kMaxHands; // 126
    constexpr float kProbabilitySumTolerance = 0.01f;
} // namespace constants

// Configuration for the streaming recognizer
struct RecognizerConfig {
    // Window
    int window_capacity{30};        // Samples per classifier input (sequence length)
    int max_hands{constants::kMaxHands};
    int feature_dim{constants::kFeatureDim}; // Must equal max_hands * 63

    // Gating
    float min_confidence{0.7f};     // Deployments run anywhere between 0.7 and 0.85

    // Presence
    int reset_threshold{10};        // Absent frames tolerated before the window is dropped

    // Smoothing
    int vote_history_size{15};      // Accepted labels kept for the majority vote

    // Inference
    int inference_timeout_ms{0};    // 0 = call the classifier inline, no timeout

    // Logging
    bool verbose{false};

    // Load from key/value file
    [[nodiscard]] bool load_from_file(const std::string& path);
    bool save_to_file(const std::string& path) const;

    // Override from SIGNREC_* environment variables
    void apply_env_overrides();

    // Validation
    [[nodiscard]] bool validate() const noexcept;
    std::string describe_invalid() const;
};

// Recognition statistics
struct RecognitionStats {
    uint64_t frames_processed{0};
    uint64_t frames_with_hands{0};
    uint64_t inferences_run{0};
    uint64_t predictions_accepted{0};
    uint64_t low_confidence_discards{0};
    uint64_t inference_failures{0};
    uint64_t gestures_recognized{0};
    uint64_t absence_resets{0};
    double avg_inference_ms{0.0};
    double last_inference_ms{0.0};

    void reset() noexcept {
        frames_processed = 0;
        frames_with_hands = 0;
        inferences_run = 0;
        predictions_accepted = 0;
        low_confidence_discards = 0;
        inference_failures = 0;
        gestures_recognized = 0;
        absence_resets = 0;
        avg_inference_ms = 0.0;
        last_inference_ms = 0.0;
    }
};

} // namespace signrec

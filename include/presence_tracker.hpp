#pragma once

#include <cstdint>

namespace signrec {

// Counts consecutive frames without any detected hand.
// The counter is not capped and is reset by the first frame with a hand.
class PresenceTracker {
public:
    explicit PresenceTracker(int reset_threshold = 10);

    // Record one frame. Returns true when the caller must clear the window
    // and vote history: more than reset_threshold absent frames in a row
    // while the window still holds samples.
    bool update(bool hands_present, bool window_empty);

    uint64_t absent_frames() const { return absent_frames_; }
    int reset_threshold() const { return reset_threshold_; }

    void reset() { absent_frames_ = 0; }

private:
    int reset_threshold_;
    uint64_t absent_frames_{0};
};

} // namespace signrec

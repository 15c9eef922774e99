#include "presence_tracker.hpp"

namespace signrec {

PresenceTracker::PresenceTracker(int reset_threshold)
    : reset_threshold_(reset_threshold < 0 ? 0 : reset_threshold) {}

bool PresenceTracker::update(bool hands_present, bool window_empty) {
    if (hands_present) {
        absent_frames_ = 0;
        return false;
    }

    ++absent_frames_;
    // Window non-empty guard: one clear per absence streak, not one per frame
    return absent_frames_ > static_cast<uint64_t>(reset_threshold_) && !window_empty;
}

} // namespace signrec

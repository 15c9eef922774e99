#pragma once

#include "gesture_recognizer.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace signrec {

enum class TargetVerdict {
    NO_TARGET,  // no target set, or event was not a recognition
    HIT,        // recognized gesture matches the target
    MISS        // recognized gesture differs from the target
};

// Practice/quiz mode on top of the recognizer's event stream: compares
// each RECOGNIZED event with a target gesture and keeps a score.
class TargetGestureFilter {
public:
    TargetGestureFilter() = default;

    // Setting or clearing the target restarts the score
    void set_target(const std::string& target);
    void clear_target();
    const std::optional<std::string>& target() const { return target_; }

    TargetVerdict evaluate(const RecognitionEvent& event);

    uint64_t attempts() const { return attempts_; }
    uint64_t hits() const { return hits_; }
    // 0 when there were no attempts
    double hit_rate() const;

    void reset_score() { attempts_ = 0; hits_ = 0; }

private:
    std::optional<std::string> target_;
    uint64_t attempts_{0};
    uint64_t hits_{0};
};

} // namespace signrec

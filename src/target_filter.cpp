#include "target_filter.hpp"
#include "gesture_name.hpp"

namespace signrec {

void TargetGestureFilter::set_target(const std::string& target) {
    if (canonicalize_gesture_name(target).empty()) {
        clear_target();
        return;
    }
    target_ = target;
    reset_score();
}

void TargetGestureFilter::clear_target() {
    target_.reset();
    reset_score();
}

TargetVerdict TargetGestureFilter::evaluate(const RecognitionEvent& event) {
    if (!target_ || !event.is_recognized()) return TargetVerdict::NO_TARGET;

    ++attempts_;
    if (gesture_names_match(event.label, *target_)) {
        ++hits_;
        return TargetVerdict::HIT;
    }
    return TargetVerdict::MISS;
}

double TargetGestureFilter::hit_rate() const {
    if (attempts_ == 0) return 0.0;
    return static_cast<double>(hits_) / static_cast<double>(attempts_);
}

} // namespace signrec

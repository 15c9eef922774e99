#include "emission_controller.hpp"

namespace signrec {

bool EmissionController::should_emit(const std::string& smoothed_label) {
    if (smoothed_label.empty()) return false;
    if (last_emitted_ && *last_emitted_ == smoothed_label) return false;

    last_emitted_ = smoothed_label;
    return true;
}

} // namespace signrec

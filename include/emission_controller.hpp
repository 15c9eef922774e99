#pragma once

#include <optional>
#include <string>

namespace signrec {

// Debounce state machine keyed on the last emitted label.
//
// A smoothed label that differs from the last emission (or the first one in
// a session) fires; the caller must then clear the window and vote history so
// the next emission needs a fresh window of evidence. Holding the same
// gesture does not fire again.
class EmissionController {
public:
    // Returns true when smoothed_label must be emitted; records it as the
    // last emitted label in that case.
    bool should_emit(const std::string& smoothed_label);

    const std::optional<std::string>& last_emitted() const { return last_emitted_; }

    void reset() { last_emitted_.reset(); }

private:
    std::optional<std::string> last_emitted_;
};

} // namespace signrec

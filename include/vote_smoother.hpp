#pragma once

#include <cstddef>
#include <deque>
#include <string>

namespace signrec {

// Bounded history of accepted labels with majority-vote resolution.
//
// Ties: among equally frequent labels, the one whose first occurrence in the
// current history is oldest wins. Counting scans oldest -> newest and keeps
// the first label to reach the maximum, so the result depends only on the
// history contents.
class VoteSmoother {
public:
    explicit VoteSmoother(size_t capacity = 15);

    // Append an accepted label (evicting the oldest beyond capacity) and
    // return the smoothed label.
    std::string add(const std::string& label);

    // Smoothed label for the current contents; empty when history is empty
    std::string resolve() const;

    // Occurrences of label in the current history
    size_t count(const std::string& label) const;

    void clear() { history_.clear(); }
    bool empty() const { return history_.empty(); }
    size_t size() const { return history_.size(); }
    size_t capacity() const { return capacity_; }

    const std::deque<std::string>& history() const { return history_; }

private:
    size_t capacity_;
    std::deque<std::string> history_;
};

} // namespace signrec

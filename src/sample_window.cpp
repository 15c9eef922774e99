#include "sample_window.hpp"
#include <algorithm>

namespace signrec {

SampleWindow::SampleWindow(size_t capacity, size_t feature_dim)
    : capacity_(std::max<size_t>(1, capacity)), feature_dim_(feature_dim) {}

bool SampleWindow::push(Sample sample) {
    if (sample.size() != feature_dim_) {
        return false;
    }
    samples_.push_back(std::move(sample));
    if (samples_.size() > capacity_) {
        samples_.pop_front();
    }
    return true;
}

std::vector<float> SampleWindow::snapshot() const {
    std::vector<float> flat;
    flat.reserve(samples_.size() * feature_dim_);
    for (const auto& s : samples_) {
        flat.insert(flat.end(), s.begin(), s.end());
    }
    return flat;
}

} // namespace signrec

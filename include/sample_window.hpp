#pragma once

#include "pose_encoder.hpp"
#include <cstddef>
#include <deque>
#include <vector>

namespace signrec {

// Bounded FIFO of Samples; the classifier's input unit.
// Once at capacity each push evicts the oldest sample.
class SampleWindow {
public:
    SampleWindow(size_t capacity, size_t feature_dim);

    // Append a sample, sliding if full. Rejects samples of the wrong length.
    bool push(Sample sample);

    bool is_full() const { return samples_.size() == capacity_; }
    bool empty() const { return samples_.empty(); }
    size_t size() const { return samples_.size(); }
    size_t capacity() const { return capacity_; }
    size_t feature_dim() const { return feature_dim_; }

    void clear() { samples_.clear(); }

    // Oldest first
    const std::deque<Sample>& samples() const { return samples_; }

    // Row-major [size() x feature_dim()] copy for inference
    std::vector<float> snapshot() const;

private:
    size_t capacity_;
    size_t feature_dim_;
    std::deque<Sample> samples_;
};

} // namespace signrec

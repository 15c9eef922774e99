#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace signrec {

// Pre-trained sequence classifier.
//
// infer() receives a row-major [steps x features] window and returns one
// probability per class, in label-set order. Implementations throw
// std::runtime_error (or another std::exception) when inference fails.
class Classifier {
public:
    virtual ~Classifier() = default;

    virtual std::vector<float> infer(const std::vector<float>& window,
                                     size_t steps, size_t features) = 0;

    // Class count the model produces, 0 when unknown
    virtual size_t num_classes() const { return 0; }

    virtual std::string name() const = 0;
};

} // namespace signrec

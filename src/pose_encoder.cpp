#include "pose_encoder.hpp"
#include <algorithm>

namespace signrec {

PoseEncoder::PoseEncoder(int max_hands)
    : max_hands_(std::max(1, max_hands)) {}

Sample PoseEncoder::encode(const Hands& hands) const {
    Sample sample(static_cast<size_t>(feature_dim()), 0.0f);

    size_t used = std::min(hands.size(), static_cast<size_t>(max_hands_));
    size_t offset = 0;
    for (size_t h = 0; h < used; ++h) {
        for (const auto& lm : hands[h].points) {
            sample[offset++] = lm.x;
            sample[offset++] = lm.y;
            sample[offset++] = lm.z;
        }
    }
    // Remaining slots stay zero
    return sample;
}

} // namespace signrec

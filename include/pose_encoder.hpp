#pragma once

#include "recognizer_config.hpp"
#include <array>
#include <vector>

namespace signrec {

// One 3-D hand landmark as produced by the pose detector.
// Planar axes are typically normalized to [0, 1]; values are used as-is.
struct Landmark {
    float x;
    float y;
    float z;

    Landmark() : x(0.0f), y(0.0f), z(0.0f) {}
    Landmark(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}
};

// Hand landmark indices (MediaPipe layout, 21 points)
enum class HandLandmark {
    WRIST = 0,
    THUMB_CMC = 1,
    THUMB_MCP = 2,
    THUMB_IP = 3,
    THUMB_TIP = 4,
    INDEX_FINGER_MCP = 5,
    INDEX_FINGER_PIP = 6,
    INDEX_FINGER_DIP = 7,
    INDEX_FINGER_TIP = 8,
    MIDDLE_FINGER_MCP = 9,
    MIDDLE_FINGER_PIP = 10,
    MIDDLE_FINGER_DIP = 11,
    MIDDLE_FINGER_TIP = 12,
    RING_FINGER_MCP = 13,
    RING_FINGER_PIP = 14,
    RING_FINGER_DIP = 15,
    RING_FINGER_TIP = 16,
    PINKY_MCP = 17,
    PINKY_PIP = 18,
    PINKY_DIP = 19,
    PINKY_TIP = 20
};

// Exactly 21 landmarks for one detected hand
struct HandLandmarks {
    std::array<Landmark, constants::kLandmarksPerHand> points;

    const Landmark& operator[](HandLandmark idx) const {
        return points[static_cast<size_t>(idx)];
    }
};

// Detector output for one frame, in detection order
using Hands = std::vector<HandLandmarks>;

// One frame's fixed-length feature vector
using Sample = std::vector<float>;

// Turns one frame's detected hands into a Sample.
// The first max_hands hands are concatenated in detection order
// (x, y, z per landmark); missing slots are zero-filled.
class PoseEncoder {
public:
    explicit PoseEncoder(int max_hands = constants::kMaxHands);

    Sample encode(const Hands& hands) const;

    int max_hands() const { return max_hands_; }
    int feature_dim() const { return max_hands_ * constants::kValuesPerHand; }

private:
    int max_hands_;
};

} // namespace signrec

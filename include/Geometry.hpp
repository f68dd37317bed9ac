#pragma once
#include "PoseFrame.hpp"

// Unsigned angle in degrees at vertex b between rays b->a and b->c, in [0, 180].
float angleBetween(const Keypoint& a, const Keypoint& b, const Keypoint& c);

inline bool isVisible(const Keypoint& kp, float threshold = 0.35f) {
  return kp.visibility > threshold;
}

enum class Side { Left, Right };

// True if shoulder, elbow and wrist of one arm are all visible.
bool armVisible(const PoseFrame& f, Side side, float threshold);

// Elbow angle averaged over the fully visible arms.
// Returns false when neither arm is usable.
bool elbowAngle(const PoseFrame& f, float threshold, float& out);

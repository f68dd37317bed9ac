#include "Geometry.hpp"
#include <cmath>

namespace {

constexpr float kRadToDeg = 180.0f / 3.14159265358979f;

float sideAngle(const PoseFrame& f, Side side) {
  if (side == Side::Left)
    return angleBetween(f[Joint::LeftShoulder], f[Joint::LeftElbow], f[Joint::LeftWrist]);
  return angleBetween(f[Joint::RightShoulder], f[Joint::RightElbow], f[Joint::RightWrist]);
}

}  // namespace

float angleBetween(const Keypoint& a, const Keypoint& b, const Keypoint& c) {
  float rad = std::atan2(c.y - b.y, c.x - b.x) - std::atan2(a.y - b.y, a.x - b.x);
  float deg = std::fabs(rad * kRadToDeg);
  if (deg > 180.0f) deg = 360.0f - deg;
  return deg;
}

bool armVisible(const PoseFrame& f, Side side, float threshold) {
  if (side == Side::Left) {
    return isVisible(f[Joint::LeftShoulder], threshold) &&
           isVisible(f[Joint::LeftElbow], threshold) &&
           isVisible(f[Joint::LeftWrist], threshold);
  }
  return isVisible(f[Joint::RightShoulder], threshold) &&
         isVisible(f[Joint::RightElbow], threshold) &&
         isVisible(f[Joint::RightWrist], threshold);
}

bool elbowAngle(const PoseFrame& f, float threshold, float& out) {
  if (!f.present) return false;

  bool left  = armVisible(f, Side::Left, threshold);
  bool right = armVisible(f, Side::Right, threshold);

  if (left && right) {
    out = (sideAngle(f, Side::Left) + sideAngle(f, Side::Right)) / 2.0f;
  } else if (left) {
    out = sideAngle(f, Side::Left);
  } else if (right) {
    out = sideAngle(f, Side::Right);
  } else {
    return false;
  }
  return true;
}

#include "PositionGate.hpp"
#include "Geometry.hpp"
#include <cmath>

const char* gateReasonName(GateReason r) {
  switch (r) {
    case GateReason::None:           return "ok";
    case GateReason::NoSubject:      return "no_subject";
    case GateReason::IncompleteBody: return "incomplete_body";
    case GateReason::NotHorizontal:  return "not_horizontal";
    case GateReason::HandsTooHigh:   return "hands_too_high";
    case GateReason::Standing:       return "standing";
  }
  return "unknown";
}

const char* gateReasonText(GateReason r) {
  switch (r) {
    case GateReason::None:           return "";
    case GateReason::NoSubject:      return "No one in frame";
    case GateReason::IncompleteBody: return "Can't see full body";
    case GateReason::NotHorizontal:  return "Body not horizontal - lie flat!";
    case GateReason::HandsTooHigh:   return "Hands too high - get on the floor!";
    case GateReason::Standing:       return "You're standing! Lie down for pushups";
  }
  return "";
}

PositionGate::PositionGate(const PushupConfig& cfg)
  : vis_(cfg.visibilityThreshold),
    horizontal_tol_(cfg.horizontalTolerance),
    hand_height_tol_(cfg.handHeightTolerance),
    standing_max_dx_(cfg.standingMaxHorizontalSpread),
    standing_min_dy_(cfg.standingMinVerticalSpread) {}

GateResult PositionGate::check(const PoseFrame& f) const {
  GateResult res;

  if (!f.present) {
    res.reason = GateReason::NoSubject;
    return res;
  }

  bool torso = isVisible(f[Joint::LeftShoulder], vis_) &&
               isVisible(f[Joint::RightShoulder], vis_) &&
               isVisible(f[Joint::LeftHip], vis_) &&
               isVisible(f[Joint::RightHip], vis_);
  bool left  = armVisible(f, Side::Left, vis_);
  bool right = armVisible(f, Side::Right, vis_);

  if (!torso || (!left && !right)) {
    res.reason = GateReason::IncompleteBody;
    return res;
  }

  float shoulderY = (f[Joint::LeftShoulder].y + f[Joint::RightShoulder].y) / 2.0f;
  float hipY      = (f[Joint::LeftHip].y + f[Joint::RightHip].y) / 2.0f;

  // 1) torso roughly horizontal
  float dy = std::fabs(shoulderY - hipY);
  if (dy > horizontal_tol_) {
    res.reason = GateReason::NotHorizontal;
    return res;
  }

  // 2) wrists on the floor, not raised well above the shoulders.
  //    Only wrists of fully tracked arms are trusted.
  float wristY = 0.0f;
  int n = 0;
  if (left)  { wristY += f[Joint::LeftWrist].y;  n++; }
  if (right) { wristY += f[Joint::RightWrist].y; n++; }
  wristY /= static_cast<float>(n);

  if (shoulderY - wristY > hand_height_tol_) {
    res.reason = GateReason::HandsTooHigh;
    return res;
  }

  // 3) near-vertical torso that slipped past the horizontal check
  float shoulderX = (f[Joint::LeftShoulder].x + f[Joint::RightShoulder].x) / 2.0f;
  float hipX      = (f[Joint::LeftHip].x + f[Joint::RightHip].x) / 2.0f;
  float dx = std::fabs(shoulderX - hipX);
  if (dx < standing_max_dx_ && dy > standing_min_dy_) {
    res.reason = GateReason::Standing;
    return res;
  }

  res.ok = true;
  return res;
}

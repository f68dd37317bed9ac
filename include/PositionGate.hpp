#pragma once
#include "PoseFrame.hpp"
#include "PushupConfig.hpp"

enum class GateReason {
  None = 0,
  NoSubject,
  IncompleteBody,
  NotHorizontal,
  HandsTooHigh,
  Standing
};

struct GateResult {
  bool ok = false;
  GateReason reason = GateReason::None;
};

const char* gateReasonName(GateReason r);   // stable code, e.g. "hands_too_high"
const char* gateReasonText(GateReason r);   // message for the user

// Checks whether a frame shows a prone plank-like push-up posture.
class PositionGate {
public:
  explicit PositionGate(const PushupConfig& cfg);

  GateResult check(const PoseFrame& f) const;

private:
  float vis_;
  float horizontal_tol_;
  float hand_height_tol_;
  float standing_max_dx_;
  float standing_min_dy_;
};

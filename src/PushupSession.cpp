#include "PushupSession.hpp"
#include "Geometry.hpp"
#include <utility>

const char* statusCodeName(StatusCode c) {
  switch (c) {
    case StatusCode::Waiting:         return "waiting";
    case StatusCode::LockingIn:       return "locking_in";
    case StatusCode::PostureRejected: return "posture_rejected";
    case StatusCode::Ready:           return "ready";
    case StatusCode::Paused:          return "paused";
    case StatusCode::Resumed:         return "resumed";
    case StatusCode::GoodDepth:       return "good_depth";
    case StatusCode::Rep:             return "rep";
    case StatusCode::Stopped:         return "stopped";
  }
  return "unknown";
}

const char* phaseName(SessionPhase p) {
  return p == SessionPhase::Locked ? "locked" : "awaiting_lock";
}

const char* stageName(Stage s) {
  return s == Stage::Down ? "down" : "up";
}

std::string formatDuration(int64_t seconds) {
  if (seconds < 0) seconds = 0;
  int64_t m = seconds / 60;
  int64_t s = seconds % 60;
  if (m > 0) return std::to_string(m) + "m " + std::to_string(s) + "s";
  return std::to_string(s) + "s";
}

PushupSession::PushupSession(const PushupConfig& cfg, int64_t start_t_ms)
  : cfg_(cfg),
    gate_(cfg),
    smoother_(cfg.smoothingFactor, cfg.neutralAngleDeg),
    reps_(cfg.downAngleDeg, cfg.upAngleDeg, cfg.repCooldownMs),
    start_t_ms_(start_t_ms) {
  cfg_.validate();
  status_.text = "Get into pushup position...";
}

bool PushupSession::isMilestone(int count) const {
  return count > 0 && count % cfg_.milestoneEvery == 0;
}

SessionSnapshot PushupSession::snapshot() const {
  SessionSnapshot s;
  s.rep_count = reps_.total();
  s.phase     = state_.phase;
  s.stage     = reps_.stage();
  s.suspended = state_.suspended;
  return s;
}

bool PushupSession::smoothedAngle(float& out) const {
  if (state_.phase != SessionPhase::Locked) return false;
  out = smoother_.value();
  return true;
}

SessionEvent PushupSession::update(const PoseFrame& f) {
  SessionEvent ev;
  ev.rep_count = reps_.total();
  if (!active_) return ev;

  // Posture is checked on every frame, before and after lock-in.
  ev.gate = gate_.check(f);

  if (state_.phase == SessionPhase::AwaitingLock) {
    awaitLock(ev.gate, ev);
  } else {
    count(f, ev.gate, ev);
  }

  dispatch(ev);
  return ev;
}

void PushupSession::awaitLock(const GateResult& gate, SessionEvent& ev) {
  if (!gate.ok) {
    // decay rather than reset, so a single flicker doesn't restart lock-in
    if (state_.lock_frame_streak > 0) state_.lock_frame_streak--;
    setStatus(ev, StatusCode::PostureRejected, gateReasonText(gate.reason), gate.reason);
    return;
  }

  state_.lock_frame_streak++;
  if (state_.lock_frame_streak < cfg_.bodyReadyThreshold) {
    setStatus(ev, StatusCode::LockingIn,
              "Detecting pose... (" + std::to_string(state_.lock_frame_streak) +
              "/" + std::to_string(cfg_.bodyReadyThreshold) + ")");
    return;
  }

  state_.phase = SessionPhase::Locked;
  state_.bad_frame_streak = 0;
  state_.suspended = false;
  reps_.resetStage();
  smoother_.reseed(cfg_.neutralAngleDeg);

  ev.readiness_changed = true;
  ev.locked = true;
  setStatus(ev, StatusCode::Ready, "GO! Start pushing!");
}

void PushupSession::count(const PoseFrame& f, const GateResult& gate, SessionEvent& ev) {
  if (!gate.ok) {
    state_.bad_frame_streak++;
    if (state_.bad_frame_streak >= cfg_.badFrameTolerance) {
      // stay locked; counting resumes on the next good frame
      state_.suspended = true;
      setStatus(ev, StatusCode::Paused, gateReasonText(gate.reason), gate.reason);
      return;
    }
    // under tolerance: count through the glitch
  } else {
    state_.bad_frame_streak = 0;
    if (state_.suspended) {
      state_.suspended = false;
      setStatus(ev, StatusCode::Resumed, "Back in position - keep going!");
    }
  }

  float raw = 0.0f;
  if (!elbowAngle(f, cfg_.visibilityThreshold, raw)) return;

  ev.angle_deg = smoother_.update(raw);
  ev.has_angle = true;

  RepEvent rep = reps_.update(ev.angle_deg, f.t_ms);
  ev.rep_count = rep.total_reps;

  if (rep.entered_down) {
    setStatus(ev, StatusCode::GoodDepth, "Good depth!");
  }
  if (rep.completed) {
    ev.rep_incremented = true;
    ev.milestone = isMilestone(rep.total_reps);
    setStatus(ev, StatusCode::Rep, "Rep " + std::to_string(rep.total_reps) + "!");
  }
}

void PushupSession::setStatus(SessionEvent& ev, StatusCode code, std::string text,
                              GateReason reason) {
  SessionStatus next;
  next.code = code;
  next.reason = reason;
  next.text = std::move(text);

  if (next == status_) return;
  status_ = next;
  ev.status_changed = true;
  ev.status = status_;
}

void PushupSession::dispatch(const SessionEvent& ev) {
  if (!listener_) return;
  if (ev.readiness_changed) listener_->onReadinessChanged(ev.locked);
  if (ev.rep_incremented)   listener_->onRepIncremented(ev.rep_count, ev.milestone);
  if (ev.status_changed)    listener_->onStatusChanged(ev.status);
}

SessionSummary PushupSession::stop(int64_t t_ms) {
  if (!active_) return summary_;

  bool was_locked = state_.phase == SessionPhase::Locked;
  active_ = false;

  summary_.rep_count = reps_.total();
  summary_.duration_ms = t_ms > start_t_ms_ ? t_ms - start_t_ms_ : 0;
  summary_.phase = state_.phase;
  summary_.stage = reps_.stage();

  SessionEvent ev;
  ev.rep_count = summary_.rep_count;
  if (was_locked) {
    ev.readiness_changed = true;
    ev.locked = false;
  }
  setStatus(ev, StatusCode::Stopped,
            "Workout complete: " + std::to_string(summary_.rep_count) + " push-ups");
  dispatch(ev);

  return summary_;
}

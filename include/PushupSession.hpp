#pragma once
#include "AngleSmoother.hpp"
#include "PoseFrame.hpp"
#include "PositionGate.hpp"
#include "PushupConfig.hpp"
#include "RepCounter.hpp"
#include <cstdint>
#include <string>

enum class SessionPhase { AwaitingLock, Locked };

enum class StatusCode {
  Waiting,          // session created, nothing seen yet
  LockingIn,        // collecting good frames
  PostureRejected,  // gate failed before lock-in
  Ready,            // just locked in
  Paused,           // locked, too many bad frames in a row
  Resumed,          // posture valid again after a pause
  GoodDepth,        // reached the bottom of a rep
  Rep,              // rep counted
  Stopped
};

const char* statusCodeName(StatusCode c);
const char* phaseName(SessionPhase p);
const char* stageName(Stage s);

struct SessionStatus {
  StatusCode code = StatusCode::Waiting;
  GateReason reason = GateReason::None;
  std::string text;

  bool operator==(const SessionStatus& o) const {
    return code == o.code && reason == o.reason && text == o.text;
  }
  bool operator!=(const SessionStatus& o) const { return !(*this == o); }
};

struct SessionSnapshot {
  int rep_count = 0;
  SessionPhase phase = SessionPhase::AwaitingLock;
  Stage stage = Stage::Up;
  bool suspended = false;

  bool operator==(const SessionSnapshot& o) const {
    return rep_count == o.rep_count && phase == o.phase &&
           stage == o.stage && suspended == o.suspended;
  }
};

// What a single frame caused. Also delivered through SessionListener.
struct SessionEvent {
  GateResult gate;

  bool status_changed = false;
  SessionStatus status;

  bool readiness_changed = false;
  bool locked = false;

  bool rep_incremented = false;
  int rep_count = 0;
  bool milestone = false;

  bool has_angle = false;       // smoothed elbow angle was updated this frame
  float angle_deg = 0.0f;
};

struct SessionSummary {
  int rep_count = 0;
  int64_t duration_ms = 0;
  SessionPhase phase = SessionPhase::AwaitingLock;   // state at stop
  Stage stage = Stage::Up;
};

// "1m 5s", "42s"
std::string formatDuration(int64_t seconds);

// Push-based observer. Default implementations ignore the event.
class SessionListener {
public:
  virtual ~SessionListener() = default;
  virtual void onStatusChanged(const SessionStatus&) {}
  virtual void onRepIncremented(int /*count*/, bool /*milestone*/) {}
  virtual void onReadinessChanged(bool /*locked*/) {}
};

// Runs one workout: lock-in, continuous posture validation and rep counting.
// Not thread-safe; feed frames in capture order from a single thread.
class PushupSession {
public:
  explicit PushupSession(const PushupConfig& cfg, int64_t start_t_ms = 0);

  // Non-owning. Pass nullptr to detach.
  void setListener(SessionListener* l) { listener_ = l; }

  SessionEvent update(const PoseFrame& f);

  // Finalizes the session; later frames are ignored. Safe to call twice.
  SessionSummary stop(int64_t t_ms);

  SessionSnapshot snapshot() const;
  const SessionStatus& status() const { return status_; }
  bool active() const { return active_; }
  bool isMilestone(int count) const;

  // Only defined once locked in.
  bool smoothedAngle(float& out) const;

  int lockFrameStreak() const { return state_.lock_frame_streak; }
  int badFrameStreak() const { return state_.bad_frame_streak; }

private:
  struct State {
    SessionPhase phase = SessionPhase::AwaitingLock;
    int lock_frame_streak = 0;
    int bad_frame_streak = 0;
    bool suspended = false;
  };

  void awaitLock(const GateResult& gate, SessionEvent& ev);
  void count(const PoseFrame& f, const GateResult& gate, SessionEvent& ev);
  void setStatus(SessionEvent& ev, StatusCode code, std::string text,
                 GateReason reason = GateReason::None);
  void dispatch(const SessionEvent& ev);

  PushupConfig cfg_;
  PositionGate gate_;
  AngleSmoother smoother_;
  RepCounter reps_;

  State state_;
  SessionStatus status_;
  SessionListener* listener_ = nullptr;

  int64_t start_t_ms_;
  bool active_ = true;
  SessionSummary summary_;
};

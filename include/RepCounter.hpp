#pragma once
#include <cstdint>

enum class Stage { Up, Down };

struct RepEvent {
  bool entered_down = false;   // Up -> Down this frame
  bool entered_up   = false;   // Down -> Up this frame, counted or not
  bool completed    = false;   // rep counted
  int total_reps = 0;
};

// Hysteresis counter over the smoothed elbow angle.
// A rep is the Down -> Up transition; the cooldown only gates the count,
// the stage always advances so the counter never sticks in Down.
class RepCounter {
public:
  RepCounter(float down_deg, float up_deg, int64_t cooldown_ms);

  RepEvent update(float angle_deg, int64_t t_ms);

  // Back to Up without touching the count or the cooldown clock.
  void resetStage() { stage_ = Stage::Up; }

  Stage stage() const { return stage_; }
  int total() const { return total_; }

private:
  float down_;
  float up_;
  int64_t cooldown_ms_;

  Stage stage_ = Stage::Up;
  int total_ = 0;
  bool has_rep_ = false;
  int64_t last_rep_t_ = 0;
};

#include "RepCounter.hpp"

RepCounter::RepCounter(float down_deg, float up_deg, int64_t cooldown_ms)
  : down_(down_deg), up_(up_deg), cooldown_ms_(cooldown_ms) {}

RepEvent RepCounter::update(float angle_deg, int64_t t_ms) {
  RepEvent ev;

  if (angle_deg < down_ && stage_ == Stage::Up) {
    stage_ = Stage::Down;
    ev.entered_down = true;
  }

  if (angle_deg > up_ && stage_ == Stage::Down) {
    stage_ = Stage::Up;
    ev.entered_up = true;

    if (!has_rep_ || (t_ms - last_rep_t_) > cooldown_ms_) {
      total_++;
      has_rep_ = true;
      last_rep_t_ = t_ms;
      ev.completed = true;
    }
  }

  ev.total_reps = total_;
  return ev;
}

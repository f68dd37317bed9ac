#include "AngleSmoother.hpp"

AngleSmoother::AngleSmoother(float alpha, float neutral_deg)
  : alpha_(alpha), value_(neutral_deg) {}

float AngleSmoother::update(float raw) {
  value_ = alpha_ * value_ + (1.0f - alpha_) * raw;
  return value_;
}

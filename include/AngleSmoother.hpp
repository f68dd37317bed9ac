#pragma once

// Exponential moving average over the elbow angle.
// alpha weights the previous value: higher alpha = steadier, slower.
class AngleSmoother {
public:
  AngleSmoother(float alpha, float neutral_deg);

  void reseed(float value) { value_ = value; }
  float update(float raw);
  float value() const { return value_; }

private:
  float alpha_;
  float value_;
};

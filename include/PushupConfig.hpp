#pragma once
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <string>

// Tunables for the rep counting pipeline. Defaults are tuned for fast push-ups.
struct PushupConfig {
  float visibilityThreshold = 0.35f;

  // lock-in
  int bodyReadyThreshold = 5;

  // rep hysteresis, degrees at the elbow
  float downAngleDeg = 110.0f;
  float upAngleDeg   = 145.0f;

  // smoothed = smoothingFactor * previous + (1 - smoothingFactor) * raw
  float smoothingFactor = 0.6f;
  float neutralAngleDeg = 160.0f;   // arms extended

  int64_t repCooldownMs = 150;
  int badFrameTolerance = 5;

  // position gate, normalized image units
  float horizontalTolerance = 0.35f;
  float handHeightTolerance = 0.25f;
  float standingMaxHorizontalSpread = 0.03f;
  float standingMinVerticalSpread   = 0.10f;

  int milestoneEvery = 10;

  // Throws std::runtime_error describing the first bad value.
  void validate() const;
};

PushupConfig configFromJson(const nlohmann::json& j);
PushupConfig loadConfig(const std::string& path);
nlohmann::json configToJson(const PushupConfig& c);

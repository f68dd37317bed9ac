#include "PushupConfig.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

using nlohmann::json;

void PushupConfig::validate() const {
  if (visibilityThreshold < 0.0f || visibilityThreshold > 1.0f)
    throw std::runtime_error("visibilityThreshold must be in [0, 1]");
  if (bodyReadyThreshold <= 0)
    throw std::runtime_error("bodyReadyThreshold must be positive");
  if (downAngleDeg >= upAngleDeg)
    throw std::runtime_error("downAngleDeg must be below upAngleDeg");
  if (smoothingFactor < 0.0f || smoothingFactor >= 1.0f)
    throw std::runtime_error("smoothingFactor must be in [0, 1)");
  if (repCooldownMs < 0)
    throw std::runtime_error("repCooldownMs must not be negative");
  if (badFrameTolerance <= 0)
    throw std::runtime_error("badFrameTolerance must be positive");
  if (neutralAngleDeg < 0.0f || neutralAngleDeg > 180.0f)
    throw std::runtime_error("neutralAngleDeg must be in [0, 180]");
  if (horizontalTolerance < 0.0f || handHeightTolerance < 0.0f)
    throw std::runtime_error("gate tolerances must not be negative");
  if (standingMaxHorizontalSpread < 0.0f || standingMinVerticalSpread < 0.0f)
    throw std::runtime_error("standing spreads must not be negative");
  if (milestoneEvery <= 0)
    throw std::runtime_error("milestoneEvery must be positive");
}

PushupConfig configFromJson(const json& j) {
  if (!j.is_object()) throw std::runtime_error("Config must be a JSON object");

  PushupConfig c;
  c.visibilityThreshold = j.value("visibilityThreshold", c.visibilityThreshold);
  c.bodyReadyThreshold  = j.value("bodyReadyThreshold", c.bodyReadyThreshold);
  c.downAngleDeg        = j.value("downAngleDeg", c.downAngleDeg);
  c.upAngleDeg          = j.value("upAngleDeg", c.upAngleDeg);
  c.smoothingFactor     = j.value("smoothingFactor", c.smoothingFactor);
  c.neutralAngleDeg     = j.value("neutralAngleDeg", c.neutralAngleDeg);
  c.repCooldownMs       = j.value("repCooldownMs", c.repCooldownMs);
  c.badFrameTolerance   = j.value("badFrameTolerance", c.badFrameTolerance);
  c.horizontalTolerance = j.value("horizontalTolerance", c.horizontalTolerance);
  c.handHeightTolerance = j.value("handHeightTolerance", c.handHeightTolerance);
  c.standingMaxHorizontalSpread =
      j.value("standingMaxHorizontalSpread", c.standingMaxHorizontalSpread);
  c.standingMinVerticalSpread =
      j.value("standingMinVerticalSpread", c.standingMinVerticalSpread);
  c.milestoneEvery      = j.value("milestoneEvery", c.milestoneEvery);

  c.validate();
  return c;
}

PushupConfig loadConfig(const std::string& path) {
  std::ifstream f(path);
  if (!f.is_open()) throw std::runtime_error("Could not open config file: " + path);

  json j;
  f >> j;
  return configFromJson(j);
}

json configToJson(const PushupConfig& c) {
  return json{
    {"visibilityThreshold", c.visibilityThreshold},
    {"bodyReadyThreshold", c.bodyReadyThreshold},
    {"downAngleDeg", c.downAngleDeg},
    {"upAngleDeg", c.upAngleDeg},
    {"smoothingFactor", c.smoothingFactor},
    {"neutralAngleDeg", c.neutralAngleDeg},
    {"repCooldownMs", c.repCooldownMs},
    {"badFrameTolerance", c.badFrameTolerance},
    {"horizontalTolerance", c.horizontalTolerance},
    {"handHeightTolerance", c.handHeightTolerance},
    {"standingMaxHorizontalSpread", c.standingMaxHorizontalSpread},
    {"standingMinVerticalSpread", c.standingMinVerticalSpread},
    {"milestoneEvery", c.milestoneEvery},
  };
}

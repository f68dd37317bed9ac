#include "JsonDataSource.hpp"
#include "PoseFrameJson.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

using nlohmann::json;

JsonDataSource::JsonDataSource(const std::string& path) {
  std::ifstream f(path);
  if (!f.is_open()) throw std::runtime_error("Could not open JSON file: " + path);

  json j;
  f >> j;
  if (!j.is_array()) throw std::runtime_error("JSON must be an array");

  frames_.reserve(j.size());
  for (const auto& item : j) {
    frames_.push_back(poseFrameFromJson(item));
  }
}

bool JsonDataSource::next(PoseFrame& out) {
  if (idx_ >= frames_.size()) return false;
  out = frames_[idx_++];
  return true;
}

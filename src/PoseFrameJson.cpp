#include "PoseFrameJson.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using nlohmann::json;

namespace {

constexpr std::size_t kBlazePoseLandmarks = 33;

// BlazePose landmark index for each Joint
constexpr int kBlazePoseIndex[kNumJoints] = {
  11, 12,   // shoulders
  13, 14,   // elbows
  15, 16,   // wrists
  23, 24,   // hips
  25, 26,   // knees
  27, 28,   // ankles
};

Keypoint keypointFromJson(const json& item) {
  if (!item.is_object()) throw std::runtime_error("Keypoint must be a JSON object");
  Keypoint kp;
  kp.x = item.value("x", 0.0f);
  kp.y = item.value("y", 0.0f);
  kp.visibility = item.value("visibility", 0.0f);
  return kp;
}

}  // namespace

PoseFrame poseFrameFromJson(const json& j) {
  if (!j.is_object()) throw std::runtime_error("Frame must be a JSON object");

  PoseFrame fr;
  fr.t_ms = j.value("t_ms", static_cast<int64_t>(0));

  auto it = j.find("keypoints");
  if (it == j.end() || it->is_null()) {
    fr.present = false;
    return fr;
  }

  const json& kps = *it;
  if (!kps.is_array()) throw std::runtime_error("keypoints must be an array");

  if (kps.size() == static_cast<std::size_t>(kNumJoints)) {
    for (int i = 0; i < kNumJoints; i++) {
      fr.keypoints[i] = keypointFromJson(kps[i]);
    }
  } else if (kps.size() == kBlazePoseLandmarks) {
    for (int i = 0; i < kNumJoints; i++) {
      fr.keypoints[i] = keypointFromJson(kps[kBlazePoseIndex[i]]);
    }
  } else {
    throw std::runtime_error("Expected 12 or 33 keypoints, got " +
                             std::to_string(kps.size()));
  }

  fr.present = true;
  return fr;
}

json poseFrameToJson(const PoseFrame& f) {
  json j;
  j["t_ms"] = f.t_ms;
  if (!f.present) {
    j["keypoints"] = nullptr;
    return j;
  }

  json kps = json::array();
  for (const auto& kp : f.keypoints) {
    kps.push_back({{"x", kp.x}, {"y", kp.y}, {"visibility", kp.visibility}});
  }
  j["keypoints"] = kps;
  return j;
}

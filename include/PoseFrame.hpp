#pragma once
#include <array>
#include <cstdint>

// Joints tracked by the counter, in frame order.
enum class Joint : int {
  LeftShoulder = 0,
  RightShoulder,
  LeftElbow,
  RightElbow,
  LeftWrist,
  RightWrist,
  LeftHip,
  RightHip,
  LeftKnee,
  RightKnee,
  LeftAnkle,
  RightAnkle,
  Count
};

constexpr int kNumJoints = static_cast<int>(Joint::Count);

struct Keypoint {
  float x = 0, y = 0;        // normalized image coords, y grows downward
  float visibility = 0;      // 0..1
};

struct PoseFrame {
  int64_t t_ms = 0;
  bool present = false;      // false = model found no subject
  std::array<Keypoint, kNumJoints> keypoints{};

  const Keypoint& operator[](Joint j) const { return keypoints[static_cast<int>(j)]; }
  Keypoint& operator[](Joint j) { return keypoints[static_cast<int>(j)]; }
};

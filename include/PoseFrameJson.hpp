#pragma once
#include "PoseFrame.hpp"
#include <nlohmann/json_fwd.hpp>

// Frame layout:
// {"t_ms":0,"keypoints":[{"x":0.4,"y":0.5,"visibility":0.9}, ...]}
// "keypoints" missing or null = no subject. The array holds either the 12
// tracked joints in Joint order or all 33 BlazePose landmarks.
PoseFrame poseFrameFromJson(const nlohmann::json& j);

nlohmann::json poseFrameToJson(const PoseFrame& f);

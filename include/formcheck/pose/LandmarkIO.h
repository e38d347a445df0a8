#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "Types.h"

namespace formcheck {

// Raw MediaPipe Pose output, x/y normalised to 0~1
struct RawKeypoint {
    float x = 0.f;
    float y = 0.f;
    float z = 0.f;
    float visibility = 0.f;
};

// MediaPipe Pose landmark index (0~32) -> joint name, "landmark_<i>" otherwise
std::string mediaPipeLandmarkName(int index);

// 将归一化坐标映射为像素坐标 (x * w, y * h), z kept as-is
LandmarkSet landmarksFromMediaPipe(const std::vector<RawKeypoint>& points, int frame_w, int frame_h);

// { name: {x, y, z?, visibility}, ... } -> LandmarkSet
// returns false when j is not an object; single malformed entries are skipped
bool parseLandmarkSetFromJson(const nlohmann::json& j, LandmarkSet& out);

/* 解析一行 landmarks .jsonl
{ frame_index, ts_ms, landmarks: { left_shoulder: {x, y, z, visibility}, ... } }
   missing / null "landmarks" -> detected = false
*/
bool parsePoseFrameLine(const std::string& line, PoseFrame& out);

// 读取整个 .jsonl; malformed lines are logged and skipped
bool readLandmarksJsonl(const std::string& jsonl_path, std::vector<PoseFrame>& out);

} // namespace formcheck

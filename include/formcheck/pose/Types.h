#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <cstdint>
#include "Enums.h"

namespace formcheck {

// 单个关键点 (detector output, never mutated by the core)
struct Landmark {
    cv::Point3f pos;                // x, y in frame units; z = relative depth (0 if 2-D)
    float       visibility = 0.f;   // 0~1

    cv::Point2f xy() const { return cv::Point2f(pos.x, pos.y); }
};

// joint name ("left_shoulder", "right_knee", ...) -> landmark, one frame
using LandmarkSet = std::unordered_map<std::string, Landmark>;

// One decoded input frame
struct PoseFrame {
    int64_t frame_index = -1;
    int64_t ts_ms = 0;
    bool detected = false;         // false: detector found no pose in this frame
    LandmarkSet landmarks;
};

// 单条规则结果
struct Verdict {
    std::string rule;
    VerdictStatus status = VerdictStatus::UNKNOWN;
    std::optional<float> value;    // measured feature, empty when unknown
    std::string message;
};

// 单帧结果
struct FrameReport {
    int64_t frame_index = -1;
    int64_t ts_ms = 0;
    Exercise exercise = Exercise::BICEP_CURL;
    Side side = Side::LEFT;
    FrameStatus status = FrameStatus::UNDETECTED;

    std::vector<Verdict> verdicts;            // fixed rule order
    std::vector<std::string> feedback;        // human readable lines
    std::vector<std::string> missing_joints;  // only set for UNDETECTED frames
};

bool operator==(const Verdict& a, const Verdict& b);
bool operator==(const FrameReport& a, const FrameReport& b);

// "left" + "shoulder" -> "left_shoulder"
std::string sideJoint(Side side, const std::string& part);

// "left" -> "Left"
std::string capitalized(const std::string& s);

// 返回单帧报告的 .json 字符串
std::string frameReportToJson(const FrameReport& report);

/* 返回一行 .jsonl
{
   frame_index, ts_ms, exercise, side, status,
   verdicts: [ { rule, status, value|null, message } ],
   feedback: [...], missing_joints: [...]
}
*/
std::string frameReportToJsonLine(const FrameReport& report);

} // namespace formcheck

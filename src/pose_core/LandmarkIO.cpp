#include "formcheck/pose/LandmarkIO.h"

#include <filesystem>
#include <fstream>
#include <iostream>

using nlohmann::json;
namespace fs = std::filesystem;

namespace formcheck {

// MediaPipe Pose landmark indices
static const char* const kMediaPipeNames[] = {
    "nose",
    "left_eye_inner", "left_eye", "left_eye_outer",
    "right_eye_inner", "right_eye", "right_eye_outer",
    "left_ear", "right_ear",
    "mouth_left", "mouth_right",
    "left_shoulder", "right_shoulder",
    "left_elbow", "right_elbow",
    "left_wrist", "right_wrist",
    "left_pinky", "right_pinky",
    "left_index", "right_index",
    "left_thumb", "right_thumb",
    "left_hip", "right_hip",
    "left_knee", "right_knee",
    "left_ankle", "right_ankle",
    "left_heel", "right_heel",
    "left_foot_index", "right_foot_index"
};
static const int kMediaPipeCount = static_cast<int>(sizeof(kMediaPipeNames) / sizeof(kMediaPipeNames[0]));

std::string mediaPipeLandmarkName(int index) {
    if (index >= 0 && index < kMediaPipeCount) return kMediaPipeNames[index];
    return "landmark_" + std::to_string(index);
}

LandmarkSet landmarksFromMediaPipe(const std::vector<RawKeypoint>& points, int frame_w, int frame_h) {
    LandmarkSet out;
    out.reserve(points.size());
    for (size_t i = 0; i < points.size(); ++i) {
        const RawKeypoint& p = points[i];
        Landmark lm;
        lm.pos = cv::Point3f(p.x * static_cast<float>(frame_w),
                             p.y * static_cast<float>(frame_h),
                             p.z);
        lm.visibility = p.visibility;
        out[mediaPipeLandmarkName(static_cast<int>(i))] = lm;
    }
    return out;
}

bool parseLandmarkSetFromJson(const json& j, LandmarkSet& out) {
    out.clear();
    if (!j.is_object()) return false;

    for (auto it = j.begin(); it != j.end(); ++it) {
        const json& v = it.value();
        if (!v.is_object() || !v.contains("x") || !v.contains("y")) {
            std::cout << "[LandmarkIO] Skipping malformed landmark: " << it.key() << std::endl;
            continue;
        }
        try {
            Landmark lm;
            lm.pos = cv::Point3f(v["x"].get<float>(), v["y"].get<float>(), v.value("z", 0.f));
            lm.visibility = v.value("visibility", 1.f);
            out[it.key()] = lm;
        } catch (const json::exception& e) {
            std::cout << "[LandmarkIO] Skipping landmark " << it.key() << ": " << e.what() << std::endl;
        }
    }
    return true;
}

bool parsePoseFrameLine(const std::string& line, PoseFrame& out) {
    out = PoseFrame();
    json j = json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return false;

    try {
        out.frame_index = j.value("frame_index", static_cast<int64_t>(-1));
        out.ts_ms = j.value("ts_ms", static_cast<int64_t>(0));
    } catch (const json::exception&) {
        return false;
    }

    if (j.contains("landmarks") && !j["landmarks"].is_null()) {
        if (!parseLandmarkSetFromJson(j["landmarks"], out.landmarks)) return false;
        out.detected = !out.landmarks.empty();
    }
    return true;
}

bool readLandmarksJsonl(const std::string& jsonl_path, std::vector<PoseFrame>& out) {
    out.clear();

    if (jsonl_path.empty()) {
        std::cout << "[LandmarkIO] Error: readLandmarksJsonl got empty path" << std::endl;
        return false;
    }
    if (!fs::exists(jsonl_path) || !fs::is_regular_file(jsonl_path)) {
        std::cout << "[LandmarkIO] Error: JSONL file not found: " << jsonl_path << std::endl;
        return false;
    }

    std::ifstream file(jsonl_path);
    if (!file.is_open()) {
        std::cout << "[LandmarkIO] Error: Failed to open JSONL file: " << jsonl_path << std::endl;
        return false;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty()) continue;

        PoseFrame frame;
        if (!parsePoseFrameLine(line, frame)) {
            std::cout << "[LandmarkIO] Error: Failed to parse JSONL line " << line_no << std::endl;
            continue;
        }
        // frame_index 缺省时按行序编号
        if (frame.frame_index < 0) frame.frame_index = static_cast<int64_t>(out.size());
        out.push_back(std::move(frame));
    }

    std::cout << "[LandmarkIO] Read " << out.size() << " frames from " << jsonl_path << std::endl;
    return !out.empty();
}

} // namespace formcheck

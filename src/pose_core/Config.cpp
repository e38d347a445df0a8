#include "formcheck/pose/Config.h"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

using nlohmann::json;

namespace formcheck {

static void try_get(const YAML::Node& n, const char* key, std::string& v) { if (n[key]) v = n[key].as<std::string>(); }
static void try_get(const YAML::Node& n, const char* key, int& v)         { if (n[key]) v = n[key].as<int>(); }
static void try_get(const YAML::Node& n, const char* key, float& v)       { if (n[key]) v = n[key].as<float>(); }

// RuleThresholds 字段表, shared by the yaml and json loaders
template <typename Getter>
static void readThresholds(Getter&& get_f, RuleThresholds& t) {
    get_f("curl_elbow_min_deg",          t.curl_elbow_min_deg);
    get_f("curl_elbow_max_deg",          t.curl_elbow_max_deg);
    get_f("curl_elbow_torso_max_ratio",  t.curl_elbow_torso_max_ratio);
    get_f("curl_top_angle_deg",          t.curl_top_angle_deg);

    get_f("raise_arm_target_deg",        t.raise_arm_target_deg);
    get_f("raise_arm_tolerance_deg",     t.raise_arm_tolerance_deg);
    get_f("raise_elbow_min_deg",         t.raise_elbow_min_deg);
    get_f("raise_elbow_max_deg",         t.raise_elbow_max_deg);
    get_f("raise_wrist_above_tolerance", t.raise_wrist_above_tolerance);

    get_f("shoulder_level_tolerance_deg", t.shoulder_level_tolerance_deg);
    get_f("hip_level_tolerance_deg",      t.hip_level_tolerance_deg);
    get_f("spine_tolerance_deg",          t.spine_tolerance_deg);
    get_f("balance_max_offset_ratio",     t.balance_max_offset_ratio);
}

FormConfig FormConfig::fromYaml(const std::string& yaml_path) {
    FormConfig c;
    if (!std::filesystem::exists(yaml_path)) {
        std::cout << "[FormConfig] Warning: " << yaml_path << " not found, using defaults" << std::endl;
        return c;
    }
    try {
        YAML::Node r = YAML::LoadFile(yaml_path);
        try_get(r, "exercise",         c.exercise);
        try_get(r, "side",             c.side);
        try_get(r, "coordinate_frame", c.coordinate_frame);
        try_get(r, "visibility_threshold", c.visibility_threshold);

        try_get(r, "smoothing_window",    c.smoothing_window);
        try_get(r, "smoothing_polyorder", c.smoothing_polyorder);

        try_get(r, "landmarks_jsonl", c.landmarks_jsonl);
        try_get(r, "reports_output",  c.reports_output);
        try_get(r, "summary_output",  c.summary_output);

        if (r["thresholds"]) {
            const YAML::Node t = r["thresholds"];
            readThresholds([&](const char* k, float& v) { try_get(t, k, v); }, c.thresholds);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("malformed config " + yaml_path + ": " + e.what());
    }
    return c;
}

FormConfig FormConfig::fromJson(const std::string& json_path) {
    FormConfig c;
    std::ifstream ifs(json_path);
    if (!ifs.is_open()) {
        std::cout << "[FormConfig] Warning: " << json_path << " not found, using defaults" << std::endl;
        return c;
    }
    try {
        json r; ifs >> r;
        auto get_s = [&](const char* k, std::string& v){ if(r.contains(k)) v = r[k].get<std::string>(); };
        auto get_i = [&](const char* k, int& v){ if(r.contains(k)) v = r[k].get<int>(); };
        auto get_f = [&](const char* k, float& v){ if(r.contains(k)) v = r[k].get<float>(); };

        get_s("exercise", c.exercise);
        get_s("side", c.side);
        get_s("coordinate_frame", c.coordinate_frame);
        get_f("visibility_threshold", c.visibility_threshold);

        get_i("smoothing_window", c.smoothing_window);
        get_i("smoothing_polyorder", c.smoothing_polyorder);

        get_s("landmarks_jsonl", c.landmarks_jsonl);
        get_s("reports_output", c.reports_output);
        get_s("summary_output", c.summary_output);

        if (r.contains("thresholds")) {
            const json& t = r["thresholds"];
            readThresholds([&](const char* k, float& v){ if(t.contains(k)) v = t[k].get<float>(); }, c.thresholds);
        }
    } catch (const json::exception& e) {
        throw ConfigError("malformed config " + json_path + ": " + e.what());
    }
    return c;
}

void FormConfig::validate() const {
    parseExercise(exercise);
    parseSide(side);
    parseCoordinateFrame(coordinate_frame);

    if (!std::isfinite(visibility_threshold) || visibility_threshold < 0.f || visibility_threshold > 1.f)
        throw ConfigError("visibility_threshold must be within [0, 1]");
    if (smoothing_window < 1 || smoothing_polyorder < 0)
        throw ConfigError("smoothing_window must be >= 1 and smoothing_polyorder >= 0");

    RuleThresholds finite = thresholds;
    readThresholds([](const char* k, float& v) {
        if (!std::isfinite(v)) throw ConfigError(std::string("threshold ") + k + " must be finite");
    }, finite);

    const RuleThresholds& t = thresholds;
    if (t.curl_elbow_min_deg > t.curl_elbow_max_deg)
        throw ConfigError("curl_elbow_min_deg exceeds curl_elbow_max_deg");
    if (t.raise_elbow_min_deg > t.raise_elbow_max_deg)
        throw ConfigError("raise_elbow_min_deg exceeds raise_elbow_max_deg");
    if (t.curl_elbow_torso_max_ratio < 0.f || t.balance_max_offset_ratio < 0.f)
        throw ConfigError("ratio thresholds must be non-negative");
    if (t.raise_arm_tolerance_deg < 0.f || t.shoulder_level_tolerance_deg < 0.f ||
        t.hip_level_tolerance_deg < 0.f || t.spine_tolerance_deg < 0.f)
        throw ConfigError("angle tolerances must be non-negative");
}

Exercise parseExercise(const std::string& name) {
    if (name == "bicep_curl")    return Exercise::BICEP_CURL;
    if (name == "lateral_raise") return Exercise::LATERAL_RAISE;
    throw ConfigError("unknown exercise: " + name);
}

Side parseSide(const std::string& name) {
    if (name == "left")  return Side::LEFT;
    if (name == "right") return Side::RIGHT;
    throw ConfigError("unknown side: " + name);
}

CoordinateFrame parseCoordinateFrame(const std::string& name) {
    if (name == "image")     return CoordinateFrame::IMAGE;
    if (name == "cartesian") return CoordinateFrame::CARTESIAN;
    throw ConfigError("unknown coordinate_frame: " + name);
}

} // namespace formcheck

#pragma once
#include <string>
#include <stdexcept>
#include "Enums.h"

namespace formcheck {

// Invalid exercise/side/frame selector or malformed config file.
// The only error class that halts the caller.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/* 规则阈值 (calibration placeholders, override from form.yml `thresholds:`)
*  角度单位: 度 (deg)
*  *_ratio: 相对躯干长度 (shoulder-hip distance), 与画面分辨率无关
*/
struct RuleThresholds {
    // bicep_curl
    float curl_elbow_min_deg         = 30.f;   // elbow_angle_range 下限
    float curl_elbow_max_deg         = 160.f;  // elbow_angle_range 上限
    float curl_elbow_torso_max_ratio = 0.35f;  // elbow_stationary: elbow 到躯干线距离 / 躯干长度
    float curl_top_angle_deg         = 180.f;  // wrist_above_elbow_at_top 仅在 elbow angle <= ~ 时检查 (180 = 每帧)

    // lateral_raise
    float raise_arm_target_deg       = 90.f;   // angle(hip, shoulder, elbow) 目标
    float raise_arm_tolerance_deg    = 20.f;
    float raise_elbow_min_deg        = 140.f;  // 微屈, 不锁死
    float raise_elbow_max_deg        = 175.f;
    float raise_wrist_above_tolerance = 0.f;   // wrist 高于 shoulder 的容差 (frame units)

    // shared posture
    float shoulder_level_tolerance_deg = 10.f;
    float hip_level_tolerance_deg      = 10.f;
    float spine_tolerance_deg          = 20.f; // angle(shoulder_mid, hip_mid, knee_mid) >= 180 - ~
    float balance_max_offset_ratio     = 0.2f; // |shoulder_mid.x - hip_mid.x| / 躯干长度
};

// Evaluator running config (load from form.yml)
struct FormConfig {
    // ===================== 字段fields ===================== //

    std::string exercise         = "bicep_curl";  // bicep_curl | lateral_raise
    std::string side             = "left";        // left | right
    std::string coordinate_frame = "image";       // image (y down) | cartesian (y up)

    float visibility_threshold = 0.5f;            // landmark visibility < ~ 视为不可用

    RuleThresholds thresholds;

    // 指标平滑 (Savitzky-Golay), used by the session summary only
    int smoothing_window    = 5;
    int smoothing_polyorder = 2;

    std::string landmarks_jsonl = "assets/samples/curl_left.jsonl";
    std::string reports_output  = "runtime/form_reports.jsonl";
    std::string summary_output  = "runtime/form_summary.json";

    // ===================== 方法methods ===================== //

    // Missing file keeps defaults; malformed file throws ConfigError.
    static FormConfig fromYaml(const std::string& yaml_path);
    static FormConfig fromJson(const std::string& json_path);

    // Throws ConfigError on unknown selectors or inconsistent thresholds.
    void validate() const;
};

Exercise parseExercise(const std::string& name);
Side parseSide(const std::string& name);
CoordinateFrame parseCoordinateFrame(const std::string& name);

} // namespace formcheck

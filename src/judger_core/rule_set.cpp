#include "formcheck/judger/rule_set.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace formcheck {

static std::string num(float v) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << v;
    return os.str();
}

static std::string anglePhrase(const std::string& a, const std::string& b, const std::string& c) {
    return "angle(" + a + ", " + b + ", " + c + ")";
}

Verdict Rule::apply(const LandmarkSet& landmarks) const {
    Verdict v;
    v.rule = name;
    v.status = VerdictStatus::UNKNOWN;

    for (const auto& j : required_joints) {
        if (!landmarks.count(j)) {
            v.message = "Cannot assess " + name + ": " + j + " not detected";
            return v;
        }
    }
    for (const auto& j : optional_joints) {
        if (!landmarks.count(j)) {
            v.message = "Cannot assess " + name + ": " + j + " not in view";
            return v;
        }
    }

    Check c = check(landmarks);
    if (!c.ok()) {
        v.message = "Cannot assess " + name + (c.status == MeasureStatus::DEGENERATE
                        ? ": degenerate joint geometry"
                        : ": low landmark confidence");
        return v;
    }

    v.status = c.holds ? VerdictStatus::PASS : VerdictStatus::FAIL;
    v.value = c.value;
    v.message = message ? message(c) : name;
    return v;
}

// ======================== bicep_curl ======================== //

static RuleList bicepCurlRules(Side side, const RuleThresholds& th, const GeometryOptions& geo) {
    const std::string shoulder = sideJoint(side, "shoulder");
    const std::string elbow    = sideJoint(side, "elbow");
    const std::string wrist    = sideJoint(side, "wrist");
    const std::string hip      = sideJoint(side, "hip");
    const std::string arm      = capitalized(toString(side)) + " arm: ";

    RuleList rules;

    Rule elbow_range;
    elbow_range.name = "elbow_angle_range";
    elbow_range.criterion = anglePhrase(shoulder, elbow, wrist) + " in [" +
                            num(th.curl_elbow_min_deg) + ", " + num(th.curl_elbow_max_deg) + "] deg";
    elbow_range.required_joints = {shoulder, elbow, wrist};
    elbow_range.check = [=](const LandmarkSet& lm) {
        Measurement a = angle(lm.at(shoulder), lm.at(elbow), lm.at(wrist), geo);
        if (!a.ok()) return Check::unusable(a.status);
        return Check::of(a.value >= th.curl_elbow_min_deg && a.value <= th.curl_elbow_max_deg, a.value);
    };
    elbow_range.message = [=](const Check& c) -> std::string {
        if (c.value < th.curl_elbow_min_deg) return arm + "Elbow too bent (curl too high)";
        if (c.value > th.curl_elbow_max_deg) return arm + "Arm almost straight (lower position)";
        return arm + "Elbow angle in range";
    };
    rules.push_back(std::move(elbow_range));

    // elbow 到 shoulder-hip 躯干线的距离, 按躯干长度归一化
    Rule stationary;
    stationary.name = "elbow_stationary";
    stationary.criterion = "distance(" + elbow + ", " + shoulder + "-" + hip + " line) <= " +
                           num(th.curl_elbow_torso_max_ratio) + " x torso length";
    stationary.required_joints = {shoulder, elbow, hip};
    stationary.check = [=](const LandmarkSet& lm) {
        const Landmark& s = lm.at(shoulder);
        const Landmark& h = lm.at(hip);
        Measurement torso = distance(s, h, geo);
        if (!torso.ok()) return Check::unusable(torso.status);
        Check near = nearBody(lm.at(elbow), s, h, th.curl_elbow_torso_max_ratio * torso.value, geo);
        if (!near.ok()) return near;
        return Check::of(near.holds, near.value / torso.value);
    };
    stationary.message = [=](const Check& c) -> std::string {
        return c.holds ? arm + "Elbow stays close to body"
                       : arm + "Keep elbow closer to body (avoid swinging)";
    };
    rules.push_back(std::move(stationary));

    Rule wrist_top;
    wrist_top.name = "wrist_above_elbow_at_top";
    wrist_top.criterion = "height(" + wrist + ") >= height(" + elbow + ") when " +
                          anglePhrase(shoulder, elbow, wrist) + " <= " + num(th.curl_top_angle_deg) + " deg";
    wrist_top.required_joints = {shoulder, elbow, wrist};
    wrist_top.check = [=](const LandmarkSet& lm) {
        Measurement a = angle(lm.at(shoulder), lm.at(elbow), lm.at(wrist), geo);
        if (!a.ok()) return Check::unusable(a.status);
        Measurement off = verticalOffset(lm.at(wrist), lm.at(elbow), geo);
        if (!off.ok()) return Check::unusable(off.status);
        bool at_top = a.value <= th.curl_top_angle_deg;
        return Check::of(!at_top || off.value >= 0.f, off.value);
    };
    wrist_top.message = [=](const Check& c) -> std::string {
        return c.holds ? arm + "Wrist position OK" : arm + "Lift your wrist higher";
    };
    rules.push_back(std::move(wrist_top));

    return rules;
}

// ======================== lateral_raise ======================== //

static RuleList lateralRaiseRules(Side side, const RuleThresholds& th, const GeometryOptions& geo) {
    const std::string shoulder = sideJoint(side, "shoulder");
    const std::string elbow    = sideJoint(side, "elbow");
    const std::string wrist    = sideJoint(side, "wrist");
    const std::string hip      = sideJoint(side, "hip");
    const std::string arm      = capitalized(toString(side)) + " arm: ";

    RuleList rules;

    Rule height;
    height.name = "arm_at_shoulder_height";
    height.criterion = anglePhrase(hip, shoulder, elbow) + " in " + num(th.raise_arm_target_deg) +
                       " +/- " + num(th.raise_arm_tolerance_deg) + " deg";
    height.required_joints = {hip, shoulder, elbow};
    height.check = [=](const LandmarkSet& lm) {
        Measurement a = angle(lm.at(hip), lm.at(shoulder), lm.at(elbow), geo);
        if (!a.ok()) return Check::unusable(a.status);
        return Check::of(std::abs(a.value - th.raise_arm_target_deg) <= th.raise_arm_tolerance_deg, a.value);
    };
    height.message = [=](const Check& c) -> std::string {
        if (c.holds) return arm + "Arm at shoulder height";
        return c.value < th.raise_arm_target_deg ? arm + "Raise arm higher to shoulder level"
                                                 : arm + "Lower arm to shoulder level";
    };
    rules.push_back(std::move(height));

    Rule bent;
    bent.name = "elbow_slightly_bent";
    bent.criterion = anglePhrase(shoulder, elbow, wrist) + " in [" +
                     num(th.raise_elbow_min_deg) + ", " + num(th.raise_elbow_max_deg) + "] deg";
    bent.required_joints = {shoulder, elbow, wrist};
    bent.check = [=](const LandmarkSet& lm) {
        Measurement a = angle(lm.at(shoulder), lm.at(elbow), lm.at(wrist), geo);
        if (!a.ok()) return Check::unusable(a.status);
        return Check::of(a.value >= th.raise_elbow_min_deg && a.value <= th.raise_elbow_max_deg, a.value);
    };
    bent.message = [=](const Check& c) -> std::string {
        if (c.value < th.raise_elbow_min_deg) return arm + "Straighten your arm more";
        if (c.value > th.raise_elbow_max_deg) return arm + "Keep elbow slightly bent (don't lock)";
        return arm + "Elbow slightly bent";
    };
    rules.push_back(std::move(bent));

    Rule wrist_cap;
    wrist_cap.name = "wrist_not_above_shoulder";
    wrist_cap.criterion = "height(" + wrist + ") - height(" + shoulder + ") <= " +
                          num(th.raise_wrist_above_tolerance);
    wrist_cap.required_joints = {shoulder, wrist};
    wrist_cap.check = [=](const LandmarkSet& lm) {
        Measurement off = verticalOffset(lm.at(wrist), lm.at(shoulder), geo);
        if (!off.ok()) return Check::unusable(off.status);
        return Check::of(off.value <= th.raise_wrist_above_tolerance, off.value);
    };
    wrist_cap.message = [=](const Check& c) -> std::string {
        return c.holds ? arm + "Wrist at or below shoulder"
                       : arm + "Don't raise wrist above shoulder level";
    };
    rules.push_back(std::move(wrist_cap));

    return rules;
}

// ======================== shared posture ======================== //

RuleList buildSharedRules(const RuleThresholds& th, const GeometryOptions& geo) {
    const std::string ls = "left_shoulder", rs = "right_shoulder";
    const std::string lh = "left_hip",      rh = "right_hip";
    const std::string lk = "left_knee",     rk = "right_knee";

    RuleList rules;

    Rule shoulders;
    shoulders.name = "shoulders_level";
    shoulders.criterion = "tilt(" + ls + ", " + rs + ") < " + num(th.shoulder_level_tolerance_deg) + " deg";
    shoulders.required_joints = {ls, rs};
    shoulders.check = [=](const LandmarkSet& lm) {
        return isLevel(lm.at(ls), lm.at(rs), th.shoulder_level_tolerance_deg, geo);
    };
    shoulders.message = [](const Check& c) -> std::string {
        return c.holds ? "Shoulders level" : "Shoulders are not level - adjust posture";
    };
    rules.push_back(std::move(shoulders));

    Rule hips;
    hips.name = "hips_level";
    hips.criterion = "tilt(" + lh + ", " + rh + ") < " + num(th.hip_level_tolerance_deg) + " deg";
    hips.required_joints = {lh, rh};
    hips.check = [=](const LandmarkSet& lm) {
        return isLevel(lm.at(lh), lm.at(rh), th.hip_level_tolerance_deg, geo);
    };
    hips.message = [](const Check& c) -> std::string {
        return c.holds ? "Hips level" : "Hips are not level - balance your stance";
    };
    rules.push_back(std::move(hips));

    Rule spine;
    spine.name = "spine_straight";
    spine.criterion = "angle(shoulder_mid, hip_mid, knee_mid) >= " +
                      num(180.f - th.spine_tolerance_deg) + " deg";
    spine.required_joints = {ls, rs, lh, rh};
    spine.optional_joints = {lk, rk};
    spine.check = [=](const LandmarkSet& lm) {
        Landmark shoulder_mid = midpoint(lm.at(ls), lm.at(rs));
        Landmark hip_mid      = midpoint(lm.at(lh), lm.at(rh));
        Landmark knee_mid     = midpoint(lm.at(lk), lm.at(rk));
        Measurement a = angle(shoulder_mid, hip_mid, knee_mid, geo);
        if (!a.ok()) return Check::unusable(a.status);
        return Check::of(a.value >= 180.f - th.spine_tolerance_deg, a.value);
    };
    spine.message = [](const Check& c) -> std::string {
        return c.holds ? "Back straight" : "Back is leaning - maintain straight posture";
    };
    rules.push_back(std::move(spine));

    // 上下半身中点水平偏移, 按躯干长度归一化
    Rule balanced;
    balanced.name = "balanced";
    balanced.criterion = "|shoulder_mid.x - hip_mid.x| <= " + num(th.balance_max_offset_ratio) +
                         " x torso length";
    balanced.required_joints = {ls, rs, lh, rh};
    balanced.check = [=](const LandmarkSet& lm) {
        Landmark shoulder_mid = midpoint(lm.at(ls), lm.at(rs));
        Landmark hip_mid      = midpoint(lm.at(lh), lm.at(rh));
        Measurement torso = distance(shoulder_mid, hip_mid, geo);
        if (!torso.ok()) return Check::unusable(torso.status);
        if (torso.value <= 0.f) return Check::unusable(MeasureStatus::DEGENERATE);
        Measurement off = horizontalOffset(shoulder_mid, hip_mid, geo);
        if (!off.ok()) return Check::unusable(off.status);
        float ratio = std::abs(off.value) / torso.value;
        return Check::of(ratio <= th.balance_max_offset_ratio, ratio);
    };
    balanced.message = [](const Check& c) -> std::string {
        return c.holds ? "Body balanced" : "Body is not balanced - center your weight";
    };
    rules.push_back(std::move(balanced));

    return rules;
}

RuleList buildExerciseRules(Exercise exercise, Side side,
                            const RuleThresholds& th, const GeometryOptions& geo) {
    switch (exercise) {
        case Exercise::BICEP_CURL:    return bicepCurlRules(side, th, geo);
        case Exercise::LATERAL_RAISE: return lateralRaiseRules(side, th, geo);
    }
    throw ConfigError("unsupported exercise: " + toString(exercise));
}

RuleList buildRuleList(Exercise exercise, Side side,
                       const RuleThresholds& th, const GeometryOptions& geo) {
    RuleList rules = buildExerciseRules(exercise, side, th, geo);
    RuleList shared = buildSharedRules(th, geo);
    for (auto& r : shared) rules.push_back(std::move(r));
    return rules;
}

std::vector<std::string> requiredJoints(const RuleList& rules) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& r : rules) {
        for (const auto& j : r.required_joints) {
            if (seen.insert(j).second) out.push_back(j);
        }
    }
    return out;
}

} // namespace formcheck

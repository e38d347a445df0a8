#include "formcheck/pose/Types.h"
#include <nlohmann/json.hpp>
#include <cctype>

namespace formcheck {

bool operator==(const Verdict& a, const Verdict& b) {
    return a.rule == b.rule && a.status == b.status &&
           a.value == b.value && a.message == b.message;
}

bool operator==(const FrameReport& a, const FrameReport& b) {
    return a.frame_index == b.frame_index && a.ts_ms == b.ts_ms &&
           a.exercise == b.exercise && a.side == b.side &&
           a.status == b.status && a.verdicts == b.verdicts &&
           a.feedback == b.feedback && a.missing_joints == b.missing_joints;
}

std::string sideJoint(Side side, const std::string& part) {
    return toString(side) + "_" + part;
}

std::string capitalized(const std::string& s) {
    if (s.empty()) return s;
    std::string out = s;
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

static nlohmann::json reportToJsonObject(const FrameReport& r) {
    nlohmann::json o;
    o["frame_index"] = r.frame_index;
    o["ts_ms"] = r.ts_ms;
    o["exercise"] = toString(r.exercise);
    o["side"] = toString(r.side);
    o["status"] = toString(r.status);

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& v : r.verdicts) {
        nlohmann::json jv;
        jv["rule"] = v.rule;
        jv["status"] = toString(v.status);
        if (v.value.has_value()) jv["value"] = *v.value;
        else jv["value"] = nullptr;
        jv["message"] = v.message;
        arr.push_back(std::move(jv));
    }
    o["verdicts"] = std::move(arr);
    o["feedback"] = r.feedback;
    o["missing_joints"] = r.missing_joints;
    return o;
}

std::string frameReportToJson(const FrameReport& report) {
    return reportToJsonObject(report).dump(2);
}

std::string frameReportToJsonLine(const FrameReport& report) {
    return reportToJsonObject(report).dump();
}

} // namespace formcheck

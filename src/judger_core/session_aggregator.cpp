#include "formcheck/judger/session_aggregator.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>

namespace formcheck {

static double ratio(int num, int den) {
    return den > 0 ? static_cast<double>(num) / static_cast<double>(den) : 0.0;
}

static MetricStats statsOf(const std::vector<double>& raw, const std::vector<double>& smoothed) {
    MetricStats m;
    if (raw.empty()) return m;

    m.count = static_cast<int>(raw.size());
    auto mm = std::minmax_element(raw.begin(), raw.end());
    m.min = *mm.first;
    m.max = *mm.second;

    double sum = 0.0;
    for (double v : smoothed) sum += v;
    m.mean = sum / static_cast<double>(smoothed.size());

    double sq = 0.0;
    for (double v : smoothed) sq += (v - m.mean) * (v - m.mean);
    m.stddev = std::sqrt(sq / static_cast<double>(smoothed.size()));   // population std
    return m;
}

SessionAggregator::SessionAggregator(const SmoothingOptions& smoothing)
    : smoothing_(smoothing) {}

void SessionAggregator::record(const FrameReport& report) {
    ++total_frames_;

    switch (report.status) {
        case FrameStatus::PASS:       ++passed_frames_; break;
        case FrameStatus::FAIL:       ++failed_frames_; break;
        case FrameStatus::UNKNOWN:    ++unknown_frames_; break;
        case FrameStatus::UNDETECTED: ++undetected_frames_; return;
    }

    bool has_unknown = false;
    for (const auto& v : report.verdicts) {
        auto it = tallies_.find(v.rule);
        if (it == tallies_.end()) {
            rule_order_.push_back(v.rule);
            it = tallies_.emplace(v.rule, RuleTally()).first;
        }
        RuleTally& t = it->second;
        switch (v.status) {
            case VerdictStatus::PASS: ++t.passed; break;
            case VerdictStatus::FAIL: ++t.failed; break;
            case VerdictStatus::UNKNOWN:
                ++t.unknown;
                has_unknown = true;
                break;
        }
        if (v.value.has_value()) t.values.push_back(static_cast<double>(*v.value));
    }
    if (has_unknown) ++frames_with_unknown_;
}

std::vector<double> SessionAggregator::smoothedSeries(const std::string& rule) const {
    auto it = tallies_.find(rule);
    if (it == tallies_.end()) return {};
    return savgolSmooth(it->second.values, smoothing_);
}

SessionSummary SessionAggregator::finalize() const {
    SessionSummary s;
    s.total_frames = total_frames_;
    s.undetected_frames = undetected_frames_;
    s.evaluated_frames = total_frames_ - undetected_frames_;
    s.passed_frames = passed_frames_;
    s.failed_frames = failed_frames_;
    s.unknown_frames = unknown_frames_;
    s.frames_with_unknown = frames_with_unknown_;
    s.clip_pass_rate = ratio(passed_frames_, s.evaluated_frames);
    s.unknown_rate = ratio(frames_with_unknown_, s.evaluated_frames);

    for (const auto& name : rule_order_) {
        const RuleTally& t = tallies_.at(name);
        RuleSummary r;
        r.rule = name;
        r.passed = t.passed;
        r.failed = t.failed;
        r.unknown = t.unknown;
        r.pass_rate = ratio(t.passed, t.passed + t.failed);
        r.metric = statsOf(t.values, savgolSmooth(t.values, smoothing_));
        s.rules.push_back(std::move(r));
    }
    return s;
}

std::string sessionSummaryToJson(const SessionSummary& s) {
    nlohmann::json root;
    root["total_frames"] = s.total_frames;
    root["evaluated_frames"] = s.evaluated_frames;
    root["passed_frames"] = s.passed_frames;
    root["failed_frames"] = s.failed_frames;
    root["unknown_frames"] = s.unknown_frames;
    root["undetected_frames"] = s.undetected_frames;
    root["frames_with_unknown"] = s.frames_with_unknown;
    root["clip_pass_rate"] = s.clip_pass_rate;
    root["unknown_rate"] = s.unknown_rate;

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : s.rules) {
        nlohmann::json o;
        o["rule"] = r.rule;
        o["passed"] = r.passed;
        o["failed"] = r.failed;
        o["unknown"] = r.unknown;
        o["pass_rate"] = r.pass_rate;
        o["metric"] = {
            {"count", r.metric.count}, {"mean", r.metric.mean}, {"std", r.metric.stddev},
            {"min", r.metric.min}, {"max", r.metric.max}
        };
        arr.push_back(std::move(o));
    }
    root["rules"] = std::move(arr);
    return root.dump(2);
}

} // namespace formcheck

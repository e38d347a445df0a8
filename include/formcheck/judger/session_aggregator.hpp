#ifndef FORMCHECK_SESSION_AGGREGATOR_HPP
#define FORMCHECK_SESSION_AGGREGATOR_HPP

#include "formcheck/pose/Types.h"
#include "formcheck/judger/metric_smoother.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace formcheck {

// measured values of one rule over the clip (smoothed series for mean/std)
struct MetricStats {
    int count = 0;
    double mean = 0.0;
    double stddev = 0.0;
    double min = 0.0;
    double max = 0.0;
};

struct RuleSummary {
    std::string rule;
    int passed = 0;
    int failed = 0;
    int unknown = 0;
    double pass_rate = 0.0;       // passed / (passed + failed)
    MetricStats metric;
};

// Clip summary handed to the metrics collaborator
struct SessionSummary {
    int total_frames = 0;
    int evaluated_frames = 0;     // total - undetected
    int passed_frames = 0;
    int failed_frames = 0;
    int unknown_frames = 0;
    int undetected_frames = 0;
    int frames_with_unknown = 0;  // at least one UNKNOWN verdict

    double clip_pass_rate = 0.0;  // passed_frames / evaluated_frames
    double unknown_rate = 0.0;    // frames_with_unknown / evaluated_frames

    std::vector<RuleSummary> rules;   // first-seen rule order
};

/*  SessionAggregator 会话统计
*
*   Append-only: record() once per frame in order, finalize() at end of clip.
*   Not thread-safe; a parallel caller serialises record().
*/
class SessionAggregator {
public:
    explicit SessionAggregator(const SmoothingOptions& smoothing = SmoothingOptions());

    void record(const FrameReport& report);
    SessionSummary finalize() const;

    int framesRecorded() const { return total_frames_; }

    // smoothed measured-value series of one rule (empty if never measured)
    std::vector<double> smoothedSeries(const std::string& rule) const;

private:
    struct RuleTally {
        int passed = 0;
        int failed = 0;
        int unknown = 0;
        std::vector<double> values;
    };

    SmoothingOptions smoothing_;

    int total_frames_ = 0;
    int passed_frames_ = 0;
    int failed_frames_ = 0;
    int unknown_frames_ = 0;
    int undetected_frames_ = 0;
    int frames_with_unknown_ = 0;

    std::vector<std::string> rule_order_;
    std::unordered_map<std::string, RuleTally> tallies_;
};

// 返回 summary 的 .json 字符串
std::string sessionSummaryToJson(const SessionSummary& summary);

} // namespace formcheck

#endif

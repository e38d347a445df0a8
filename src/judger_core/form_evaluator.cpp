#include "formcheck/judger/form_evaluator.hpp"
#include "formcheck/pose/Publish.h"
#include "formcheck/pose/Geometry.h"

#include <initializer_list>
#include <map>
#include <utility>

namespace formcheck {

struct FormEvaluator::Impl {
    Exercise exercise = Exercise::BICEP_CURL;
    Side side = Side::LEFT;

    std::map<std::pair<Exercise, Side>, RuleList> table;
    std::map<std::pair<Exercise, Side>, std::vector<std::string>> required;

    ReportPublisher* publisher = nullptr;

    static FrameReport undetected(Exercise ex, Side s, std::vector<std::string> missing) {
        FrameReport r;
        r.exercise = ex;
        r.side = s;
        r.status = FrameStatus::UNDETECTED;
        r.missing_joints = std::move(missing);
        r.feedback.push_back("No pose detected");
        return r;
    }
};

FormEvaluator::FormEvaluator(const FormConfig& cfg)
    : impl_(new Impl)
{
    cfg.validate();
    impl_->exercise = parseExercise(cfg.exercise);
    impl_->side = parseSide(cfg.side);

    GeometryOptions geo;
    geo.min_visibility = cfg.visibility_threshold;
    geo.frame = parseCoordinateFrame(cfg.coordinate_frame);

    for (Exercise ex : {Exercise::BICEP_CURL, Exercise::LATERAL_RAISE}) {
        for (Side s : {Side::LEFT, Side::RIGHT}) {
            RuleList rules = buildRuleList(ex, s, cfg.thresholds, geo);
            impl_->required[{ex, s}] = requiredJoints(rules);
            impl_->table[{ex, s}] = std::move(rules);
        }
    }
}

FormEvaluator::~FormEvaluator() = default;

const RuleList& FormEvaluator::rules(Exercise exercise, Side side) const {
    return impl_->table.at({exercise, side});
}

Exercise FormEvaluator::exercise() const { return impl_->exercise; }
Side FormEvaluator::side() const { return impl_->side; }

void FormEvaluator::setPublisher(ReportPublisher* p) { impl_->publisher = p; }

FrameReport FormEvaluator::evaluate(const LandmarkSet& landmarks, Exercise exercise, Side side) const {
    std::vector<std::string> missing;
    for (const auto& j : impl_->required.at({exercise, side})) {
        if (!landmarks.count(j)) missing.push_back(j);
    }
    if (!missing.empty()) return Impl::undetected(exercise, side, std::move(missing));

    FrameReport report;
    report.exercise = exercise;
    report.side = side;

    bool any_fail = false;
    bool any_unknown = false;
    for (const Rule& rule : rules(exercise, side)) {
        Verdict v = rule.apply(landmarks);
        if (v.status == VerdictStatus::FAIL) {
            any_fail = true;
            report.feedback.push_back(v.message);
        } else if (v.status == VerdictStatus::UNKNOWN) {
            any_unknown = true;
            report.feedback.push_back(v.message);
        }
        report.verdicts.push_back(std::move(v));
    }

    if (any_fail)         report.status = FrameStatus::FAIL;
    else if (any_unknown) report.status = FrameStatus::UNKNOWN;
    else                  report.status = FrameStatus::PASS;

    if (report.status == FrameStatus::PASS) {
        std::string title = toString(exercise);
        for (auto& ch : title) if (ch == '_') ch = ' ';
        report.feedback.push_back(capitalized(toString(side)) + " " + title + ": Good form!");
    }
    return report;
}

FrameReport FormEvaluator::evaluate(const LandmarkSet& landmarks, int64_t frame_index, int64_t ts_ms) const {
    FrameReport report = evaluate(landmarks, impl_->exercise, impl_->side);
    report.frame_index = frame_index;
    report.ts_ms = ts_ms;
    return report;
}

FrameReport FormEvaluator::process(const PoseFrame& frame) {
    FrameReport report;
    if (!frame.detected) {
        report = Impl::undetected(impl_->exercise, impl_->side,
                                  impl_->required.at({impl_->exercise, impl_->side}));
        report.frame_index = frame.frame_index;
        report.ts_ms = frame.ts_ms;
    } else {
        report = evaluate(frame.landmarks, frame.frame_index, frame.ts_ms);
    }

    if (impl_->publisher) impl_->publisher->publish(report);
    return report;
}

} // namespace formcheck

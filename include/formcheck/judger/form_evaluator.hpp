#ifndef FORMCHECK_FORM_EVALUATOR_HPP
#define FORMCHECK_FORM_EVALUATOR_HPP

#include "formcheck/pose/Types.h"
#include "formcheck/pose/Config.h"
#include "formcheck/judger/rule_set.hpp"

#include <memory>

namespace formcheck {

class ReportPublisher;

/*  FormEvaluator 单帧姿态判定
*
*   Holds the (exercise, side) -> RuleList table built from one FormConfig.
*   Stateless across frames: evaluate() only reads its arguments.
*/
class FormEvaluator {
public:
    // throws ConfigError before any frame is processed
    explicit FormEvaluator(const FormConfig& cfg);
    ~FormEvaluator();

    FrameReport evaluate(const LandmarkSet& landmarks, Exercise exercise, Side side) const;

    // configured exercise / side, stamped with frame_index and ts_ms
    FrameReport evaluate(const LandmarkSet& landmarks, int64_t frame_index = -1, int64_t ts_ms = 0) const;

    // evaluate + publish; frames without a detected pose become UNDETECTED
    FrameReport process(const PoseFrame& frame);

    const RuleList& rules(Exercise exercise, Side side) const;

    Exercise exercise() const;
    Side side() const;

    void setPublisher(ReportPublisher* p); // 不持有

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace formcheck

#endif

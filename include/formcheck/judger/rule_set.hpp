#ifndef FORMCHECK_RULE_SET_HPP
#define FORMCHECK_RULE_SET_HPP

#include "formcheck/pose/Types.h"
#include "formcheck/pose/Config.h"
#include "formcheck/pose/Geometry.h"

#include <functional>
#include <string>
#include <vector>

namespace formcheck {

/*  Rule 规则记录
*
*   name:            stable identifier used in reports and the session summary
*   criterion:       readable threshold description ("angle(...) in [30, 160] deg")
*   required_joints: absent from the LandmarkSet -> frame is UNDETECTED
*   optional_joints: absent -> this verdict is UNKNOWN, frame still evaluated
*   check:           feature computation + threshold
*   message:         feedback for a decided check (pass or fail)
*/
struct Rule {
    std::string name;
    std::string criterion;
    std::vector<std::string> required_joints;
    std::vector<std::string> optional_joints;
    std::function<Check(const LandmarkSet&)> check;
    std::function<std::string(const Check&)> message;

    Verdict apply(const LandmarkSet& landmarks) const;
};

using RuleList = std::vector<Rule>;

// bicep_curl / lateral_raise rules for one side
RuleList buildExerciseRules(Exercise exercise, Side side,
                            const RuleThresholds& th, const GeometryOptions& geo);

// shoulders_level, hips_level, spine_straight, balanced
RuleList buildSharedRules(const RuleThresholds& th, const GeometryOptions& geo);

// exercise rules followed by shared rules
RuleList buildRuleList(Exercise exercise, Side side,
                       const RuleThresholds& th, const GeometryOptions& geo);

// union of required joints, first-seen order
std::vector<std::string> requiredJoints(const RuleList& rules);

} // namespace formcheck

#endif

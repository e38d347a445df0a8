#include <gtest/gtest.h>

#include "formcheck/judger/form_evaluator.hpp"
#include "formcheck/pose/Publish.h"
#include "test_helpers.hpp"

using namespace formcheck;
using namespace formcheck::testing_util;

namespace {

// arm raised sideways to shoulder height with a slight elbow bend
LandmarkSet lateralRaiseTop() {
    LandmarkSet body = uprightBody();
    body["left_elbow"] = lm(1.f, 0.1f);
    body["left_wrist"] = lm(2.f, 0.f);
    return body;
}

} // namespace

TEST(FormEvaluator, BicepCurlScenario) {
    FormEvaluator eval(cartesianConfig("bicep_curl", "left"));

    LandmarkSet body = uprightBody();
    body["left_shoulder"] = lm(0.f, 0.f);
    body["left_elbow"] = lm(0.f, -1.f);
    body["left_wrist"] = lm(0.3f, -1.8f);

    FrameReport r = eval.evaluate(body, Exercise::BICEP_CURL, Side::LEFT);

    const Verdict* range = findVerdict(r, "elbow_angle_range");
    ASSERT_NE(range, nullptr);
    EXPECT_EQ(range->status, VerdictStatus::PASS);
    ASSERT_TRUE(range->value.has_value());
    EXPECT_NEAR(*range->value, 160.f, 1.f);

    const Verdict* wrist = findVerdict(r, "wrist_above_elbow_at_top");
    ASSERT_NE(wrist, nullptr);
    EXPECT_EQ(wrist->status, VerdictStatus::FAIL);
    EXPECT_EQ(wrist->message, "Left arm: Lift your wrist higher");

    EXPECT_EQ(r.status, FrameStatus::FAIL);
    ASSERT_FALSE(r.feedback.empty());
    EXPECT_EQ(r.feedback.front(), "Left arm: Lift your wrist higher");
}

TEST(FormEvaluator, LateralRaiseScenario) {
    FormEvaluator eval(cartesianConfig("lateral_raise", "left"));
    FrameReport r = eval.evaluate(lateralRaiseTop(), Exercise::LATERAL_RAISE, Side::LEFT);

    for (const char* name : {"arm_at_shoulder_height", "elbow_slightly_bent", "wrist_not_above_shoulder"}) {
        const Verdict* v = findVerdict(r, name);
        ASSERT_NE(v, nullptr) << name;
        EXPECT_EQ(v->status, VerdictStatus::PASS) << name << ": " << v->message;
    }
    EXPECT_EQ(r.status, FrameStatus::PASS);
    ASSERT_EQ(r.feedback.size(), 1u);
    EXPECT_EQ(r.feedback[0], "Left lateral raise: Good form!");
}

TEST(FormEvaluator, UnevenShouldersFailForEveryExercise) {
    FormEvaluator eval(cartesianConfig());
    LandmarkSet body = lateralRaiseTop();
    body["right_shoulder"] = lm(-1.f, 0.8f);

    for (Exercise ex : {Exercise::BICEP_CURL, Exercise::LATERAL_RAISE}) {
        FrameReport r = eval.evaluate(body, ex, Side::LEFT);
        const Verdict* v = findVerdict(r, "shoulders_level");
        ASSERT_NE(v, nullptr);
        EXPECT_EQ(v->status, VerdictStatus::FAIL);
        EXPECT_EQ(v->message, "Shoulders are not level - adjust posture");
        EXPECT_EQ(r.status, FrameStatus::FAIL);
    }
}

TEST(FormEvaluator, LowVisibilityEverywhereGivesOnlyUnknown) {
    FormEvaluator eval(cartesianConfig());
    LandmarkSet body = uprightBody();
    for (auto& kv : body) kv.second.visibility = 0.1f;

    for (Exercise ex : {Exercise::BICEP_CURL, Exercise::LATERAL_RAISE}) {
        FrameReport r = eval.evaluate(body, ex, Side::LEFT);
        ASSERT_FALSE(r.verdicts.empty());
        for (const auto& v : r.verdicts) {
            EXPECT_EQ(v.status, VerdictStatus::UNKNOWN) << v.rule;
            EXPECT_FALSE(v.value.has_value());
        }
        EXPECT_EQ(r.status, FrameStatus::UNKNOWN);
    }
}

TEST(FormEvaluator, MissingRequiredJointIsUndetected) {
    FormEvaluator eval(cartesianConfig());
    LandmarkSet body = uprightBody();
    body.erase("left_wrist");

    FrameReport r;
    ASSERT_NO_THROW(r = eval.evaluate(body, Exercise::BICEP_CURL, Side::LEFT));
    EXPECT_EQ(r.status, FrameStatus::UNDETECTED);
    EXPECT_TRUE(r.verdicts.empty());
    ASSERT_EQ(r.missing_joints.size(), 1u);
    EXPECT_EQ(r.missing_joints[0], "left_wrist");
}

TEST(FormEvaluator, UntrackedSideMayBeMissing) {
    FormEvaluator eval(cartesianConfig());
    LandmarkSet body = lateralRaiseTop();
    body.erase("right_elbow");
    body.erase("right_wrist");

    FrameReport r = eval.evaluate(body, Exercise::LATERAL_RAISE, Side::LEFT);
    EXPECT_EQ(r.status, FrameStatus::PASS);
}

TEST(FormEvaluator, MissingKneesOnlyMakeSpineUnknown) {
    FormEvaluator eval(cartesianConfig());
    LandmarkSet body = lateralRaiseTop();
    body.erase("left_knee");
    body.erase("right_knee");

    FrameReport r = eval.evaluate(body, Exercise::LATERAL_RAISE, Side::LEFT);
    EXPECT_EQ(r.status, FrameStatus::UNKNOWN);
    const Verdict* spine = findVerdict(r, "spine_straight");
    ASSERT_NE(spine, nullptr);
    EXPECT_EQ(spine->status, VerdictStatus::UNKNOWN);
    EXPECT_EQ(r.verdicts.size(), 7u);
}

TEST(FormEvaluator, FailOutranksUnknown) {
    FormEvaluator eval(cartesianConfig());
    LandmarkSet body = lateralRaiseTop();
    body.erase("left_knee");
    body["left_wrist"] = lm(2.f, 1.f);         // wrist above shoulder

    FrameReport r = eval.evaluate(body, Exercise::LATERAL_RAISE, Side::LEFT);
    EXPECT_EQ(r.status, FrameStatus::FAIL);
}

TEST(FormEvaluator, DegenerateArmIsUnknownNotFail) {
    FormEvaluator eval(cartesianConfig("bicep_curl", "left"));
    LandmarkSet body = uprightBody();
    body["left_elbow"] = lm(0.f, 0.f);         // coincides with left_shoulder

    FrameReport r = eval.evaluate(body, Exercise::BICEP_CURL, Side::LEFT);

    for (const char* name : {"elbow_angle_range", "wrist_above_elbow_at_top"}) {
        const Verdict* v = findVerdict(r, name);
        ASSERT_NE(v, nullptr) << name;
        EXPECT_EQ(v->status, VerdictStatus::UNKNOWN) << name;
        EXPECT_FALSE(v->value.has_value()) << name;
    }
    for (const auto& v : r.verdicts) EXPECT_NE(v.status, VerdictStatus::FAIL) << v.rule;
    EXPECT_EQ(r.status, FrameStatus::UNKNOWN);

    bool reported = false;
    for (const auto& line : r.feedback) {
        if (line == "Cannot assess elbow_angle_range: degenerate joint geometry") reported = true;
    }
    EXPECT_TRUE(reported);
}

TEST(FormEvaluator, EvaluateIsIdempotent) {
    FormEvaluator eval(cartesianConfig());
    LandmarkSet body = uprightBody();
    body["left_wrist"] = lm(0.3f, -1.8f);

    FrameReport a = eval.evaluate(body, 7, 231);
    FrameReport b = eval.evaluate(body, 7, 231);
    EXPECT_TRUE(a == b);
    EXPECT_EQ(a.frame_index, 7);
    EXPECT_EQ(a.ts_ms, 231);
}

TEST(FormEvaluator, RightSideUsesRightJoints) {
    FormEvaluator eval(cartesianConfig("bicep_curl", "right"));
    LandmarkSet body = uprightBody();
    body.erase("left_wrist");                  // untracked arm

    FrameReport r = eval.evaluate(body);
    EXPECT_EQ(r.side, Side::RIGHT);
    EXPECT_NE(r.status, FrameStatus::UNDETECTED);
}

TEST(FormEvaluator, UnknownExerciseIsConfigError) {
    FormConfig cfg = cartesianConfig("squat", "left");
    EXPECT_THROW(FormEvaluator eval(cfg), ConfigError);
}

TEST(FormEvaluator, UnknownSideIsConfigError) {
    FormConfig cfg = cartesianConfig("bicep_curl", "both");
    EXPECT_THROW(FormEvaluator eval(cfg), ConfigError);
}

TEST(FormEvaluator, ProcessPublishesEveryFrame) {
    FormEvaluator eval(cartesianConfig());
    ReportPublisher pub;
    std::vector<FrameReport> seen;
    pub.setCallback([&seen](const FrameReport& r) { seen.push_back(r); });
    eval.setPublisher(&pub);

    PoseFrame detected;
    detected.frame_index = 0;
    detected.detected = true;
    detected.landmarks = uprightBody();

    PoseFrame empty;
    empty.frame_index = 1;
    empty.ts_ms = 33;

    FrameReport r0 = eval.process(detected);
    FrameReport r1 = eval.process(empty);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_TRUE(seen[0] == r0);
    EXPECT_EQ(r1.status, FrameStatus::UNDETECTED);
    EXPECT_EQ(r1.frame_index, 1);
    EXPECT_EQ(r1.ts_ms, 33);
    ASSERT_FALSE(r1.feedback.empty());
    EXPECT_EQ(r1.feedback[0], "No pose detected");
}

// tests/target_evaluator_test.cpp

#include <gtest/gtest.h>
#include "target_evaluator.hpp"

using namespace sentry;

namespace {

Detection makeDetection(float x, float y, float w, float h,
                        const std::string& name = "object", float score = 0.8f) {
    Detection d;
    d.box = {x, y, w, h};
    d.categories.push_back({name, 0, score});
    return d;
}

} // namespace

class TargetEvaluatorTest : public ::testing::Test {
protected:
    TargetEvaluator evaluator{CenterZone{}, 640, 480};
};

TEST_F(TargetEvaluatorTest, BoxAtFrameCenterIsCentered) {
    // centroid (320, 240) -> (0.5, 0.5)
    EXPECT_TRUE(evaluator.isCentered({280, 200, 80, 80}));
    EXPECT_TRUE(evaluator.isCentered({320, 240, 0, 0}));
}

TEST_F(TargetEvaluatorTest, CornersAreNeverCentered) {
    EXPECT_FALSE(evaluator.isCentered({0, 0, 0, 0}));
    EXPECT_FALSE(evaluator.isCentered({640, 480, 0, 0}));
    EXPECT_FALSE(evaluator.isCentered({0, 0, 10, 10}));
}

TEST_F(TargetEvaluatorTest, ZoneBoundsAreInclusive) {
    // centroid x = 0.4 * 640 = 256, y = 0.6 * 480 = 288
    EXPECT_TRUE(evaluator.isCentered({256, 288, 0, 0}));
    EXPECT_FALSE(evaluator.isCentered({250, 288, 0, 0}));
}

TEST_F(TargetEvaluatorTest, BothAxesMustBeInside) {
    EXPECT_FALSE(evaluator.isCentered({280, 0, 80, 80}));
    EXPECT_FALSE(evaluator.isCentered({0, 200, 80, 80}));
}

TEST_F(TargetEvaluatorTest, HaltIsOrOverDetections) {
    DetectionResult result;
    result.detections.push_back(makeDetection(0, 0, 10, 10));
    result.detections.push_back(makeDetection(280, 200, 80, 80));
    result.detections.push_back(makeDetection(600, 400, 30, 30));

    TargetAssessment a = evaluator.evaluate(result);

    EXPECT_TRUE(a.halt);
    EXPECT_EQ(a.target_index, 1);
    ASSERT_EQ(a.centered.size(), 3u);
    EXPECT_FALSE(a.centered[0]);
    EXPECT_TRUE(a.centered[1]);
    EXPECT_FALSE(a.centered[2]);
}

TEST_F(TargetEvaluatorTest, EmptyResultDoesNotHalt) {
    TargetAssessment a = evaluator.evaluate(DetectionResult{});
    EXPECT_FALSE(a.halt);
    EXPECT_EQ(a.target_index, -1);
    EXPECT_TRUE(a.centered.empty());
}

TEST_F(TargetEvaluatorTest, ClassFilterLimitsWhatHalts) {
    TargetEvaluator fire_only(CenterZone{}, 640, 480, {"fire"});

    DetectionResult person;
    person.detections.push_back(makeDetection(280, 200, 80, 80, "person"));
    TargetAssessment a = fire_only.evaluate(person);
    EXPECT_FALSE(a.halt);
    ASSERT_EQ(a.centered.size(), 1u);
    EXPECT_TRUE(a.centered[0]);  // still reported as centered for the overlay

    DetectionResult fire;
    fire.detections.push_back(makeDetection(280, 200, 80, 80, "fire"));
    EXPECT_TRUE(fire_only.evaluate(fire).halt);
}

TEST_F(TargetEvaluatorTest, CustomZone) {
    CenterZone wide{0.1, 0.9, 0.1, 0.9};
    TargetEvaluator wide_eval(wide, 640, 480);
    EXPECT_TRUE(wide_eval.isCentered({64, 48, 0, 0}));
    EXPECT_FALSE(evaluator.isCentered({64, 48, 0, 0}));
}

TEST_F(TargetEvaluatorTest, RejectsBadGeometry) {
    EXPECT_THROW(TargetEvaluator(CenterZone{}, 0, 480), std::invalid_argument);
    CenterZone inverted{0.6, 0.4, 0.4, 0.6};
    EXPECT_THROW(TargetEvaluator(inverted, 640, 480), std::invalid_argument);
}

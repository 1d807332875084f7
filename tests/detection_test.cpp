// tests/detection_test.cpp

#include <gtest/gtest.h>
#include "detection.hpp"

using namespace sentry;

namespace {

Detection makeDetection(const std::string& name, float score) {
    Detection d;
    d.box = {10, 10, 20, 20};
    d.categories.push_back({name, 0, score});
    return d;
}

} // namespace

TEST(FilterDetectionsTest, DropsBelowThresholdAndSortsByScore) {
    std::vector<Detection> input = {
        makeDetection("cup", 0.30f),
        makeDetection("fire", 0.90f),
        makeDetection("person", 0.10f),
        makeDetection("dog", 0.55f),
    };

    auto out = filterDetections(input, 0.25f, 0);

    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].top()->name, "fire");
    EXPECT_EQ(out[1].top()->name, "dog");
    EXPECT_EQ(out[2].top()->name, "cup");
}

TEST(FilterDetectionsTest, CapsAtMaxResults) {
    std::vector<Detection> input = {
        makeDetection("a", 0.4f),
        makeDetection("b", 0.8f),
        makeDetection("c", 0.6f),
    };

    auto out = filterDetections(input, 0.0f, 2);

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].top()->name, "b");
    EXPECT_EQ(out[1].top()->name, "c");
}

TEST(FilterDetectionsTest, DetectionWithoutCategoryIsDropped) {
    Detection empty;
    empty.box = {0, 0, 5, 5};

    auto out = filterDetections({empty, makeDetection("x", 0.5f)}, 0.0f, 0);

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].top()->name, "x");
    EXPECT_EQ(empty.top(), nullptr);
    EXPECT_FLOAT_EQ(empty.topScore(), 0.0f);
}

TEST(FilterDetectionsTest, ScoreEqualToThresholdIsKept) {
    auto out = filterDetections({makeDetection("edge", 0.25f)}, 0.25f, 3);
    EXPECT_EQ(out.size(), 1u);
}

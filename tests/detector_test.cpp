// tests/detector_test.cpp

#include <gtest/gtest.h>
#include <unistd.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <vector>

#include "detector.hpp"

using namespace sentry;

namespace {

// Builds a [1, 1, N, 7] DetectionOutput blob
cv::Mat detectionBlob(const std::vector<std::vector<float>>& rows) {
    int sizes[] = {1, 1, static_cast<int>(rows.size()), 7};
    cv::Mat blob(4, sizes, CV_32F, cv::Scalar(0));
    float* data = blob.ptr<float>();
    for (size_t i = 0; i < rows.size(); i++) {
        for (int j = 0; j < 7; j++) {
            data[i * 7 + j] = rows[i][j];
        }
    }
    return blob;
}

} // namespace

class DetectorTest : public ::testing::Test {
protected:
    DetectorTest() {
        config.score_threshold = 0.3f;
        config.max_results = 3;
    }

    DetectorConfig config;
};

TEST_F(DetectorTest, ScalesBoxesToFrameSize) {
    DnnInferenceEngine engine(config);
    cv::Mat blob = detectionBlob({{0, 1, 0.9f, 0.25f, 0.5f, 0.75f, 1.0f}});

    auto dets = engine.parseDetections(blob, 640, 480);
    ASSERT_EQ(dets.size(), 1u);
    EXPECT_FLOAT_EQ(dets[0].box.x, 160.0f);
    EXPECT_FLOAT_EQ(dets[0].box.y, 240.0f);
    EXPECT_FLOAT_EQ(dets[0].box.width, 320.0f);
    EXPECT_FLOAT_EQ(dets[0].box.height, 240.0f);
    EXPECT_EQ(dets[0].categories[0].index, 1);
    EXPECT_FLOAT_EQ(dets[0].topScore(), 0.9f);
}

TEST_F(DetectorTest, FiltersSortsAndCaps) {
    DnnInferenceEngine engine(config);
    cv::Mat blob = detectionBlob({
        {0, 0, 0.40f, 0.1f, 0.1f, 0.2f, 0.2f},
        {0, 0, 0.10f, 0.1f, 0.1f, 0.2f, 0.2f},  // below threshold
        {0, 0, 0.95f, 0.1f, 0.1f, 0.2f, 0.2f},
        {0, 0, 0.50f, 0.1f, 0.1f, 0.2f, 0.2f},
        {0, 0, 0.35f, 0.1f, 0.1f, 0.2f, 0.2f},
    });

    auto dets = engine.parseDetections(blob, 100, 100);
    ASSERT_EQ(dets.size(), 3u);
    EXPECT_FLOAT_EQ(dets[0].topScore(), 0.95f);
    EXPECT_FLOAT_EQ(dets[1].topScore(), 0.50f);
    EXPECT_FLOAT_EQ(dets[2].topScore(), 0.40f);
}

TEST_F(DetectorTest, ClampsAndSkipsDegenerateBoxes) {
    DnnInferenceEngine engine(config);
    cv::Mat blob = detectionBlob({
        {0, 0, 0.9f, -0.5f, -0.5f, 0.5f, 0.5f},
        {0, 0, 0.8f, 0.6f, 0.6f, 0.6f, 0.9f},  // zero width
    });

    auto dets = engine.parseDetections(blob, 200, 100);
    ASSERT_EQ(dets.size(), 1u);
    EXPECT_FLOAT_EQ(dets[0].box.x, 0.0f);
    EXPECT_FLOAT_EQ(dets[0].box.y, 0.0f);
    EXPECT_FLOAT_EQ(dets[0].box.width, 100.0f);
    EXPECT_FLOAT_EQ(dets[0].box.height, 50.0f);
}

TEST_F(DetectorTest, IgnoresUnexpectedLayout) {
    DnnInferenceEngine engine(config);
    cv::Mat flat(10, 6, CV_32F, cv::Scalar(0.5f));
    EXPECT_TRUE(engine.parseDetections(flat, 640, 480).empty());
}

TEST_F(DetectorTest, UnknownClassGetsNumericName) {
    DnnInferenceEngine engine(config);
    EXPECT_EQ(engine.labelFor(17), "class_17");
}

TEST_F(DetectorTest, LoadsLabelsOnePerLine) {
    char path[] = "/tmp/sentry_labelsXXXXXX";
    int fd = ::mkstemp(path);
    ASSERT_NE(fd, -1);
    {
        std::ofstream out(path);
        out << "person\r\nfire\nsmoke\n";
    }

    std::vector<std::string> labels;
    ASSERT_TRUE(DnnInferenceEngine::loadLabels(path, labels));
    ASSERT_EQ(labels.size(), 3u);
    EXPECT_EQ(labels[0], "person");
    EXPECT_EQ(labels[2], "smoke");

    ::close(fd);
    std::remove(path);
}

TEST_F(DetectorTest, InitializeFailsOnMissingModel) {
    config.model_path = "/nonexistent/model.onnx";
    DnnInferenceEngine engine(config);
    EXPECT_FALSE(engine.initialize());
    EXPECT_FALSE(engine.lastError().empty());
    EXPECT_THROW(engine.infer(cv::Mat(10, 10, CV_8UC3)), std::runtime_error);
}

// detector.hpp
#pragma once

#include <opencv2/opencv.hpp>
#include <opencv2/dnn.hpp>
#include <string>
#include <vector>

#include "config.hpp"
#include "detection.hpp"

namespace sentry {

// Synchronous inference; AsyncDetector runs it on its worker thread
class InferenceEngine {
public:
    virtual ~InferenceEngine() = default;

    virtual bool initialize() = 0;
    virtual std::vector<Detection> infer(const cv::Mat& frame) = 0;

    virtual const std::string& lastError() const = 0;
};

/**
 * SSD-style detector on OpenCV DNN (TensorFlow, Caffe, ONNX or TFLite
 * models that end in a DetectionOutput layer).
 *
 * Output is [1, 1, N, 7]: image_id, class_id, score, x1, y1, x2, y2 with
 * normalized coordinates. Boxes are scaled to the input frame, filtered by
 * score_threshold and capped at max_results, best first.
 */
class DnnInferenceEngine : public InferenceEngine {
public:
    explicit DnnInferenceEngine(const DetectorConfig& config);

    // Loads the model and runs one blank-frame inference to check the output layout
    bool initialize() override;
    std::vector<Detection> infer(const cv::Mat& frame) override;

    const std::string& lastError() const override { return last_error_; }
    const std::vector<std::string>& labels() const { return labels_; }

    // Exposed for tests: parse a DetectionOutput blob for a frame of the given size
    std::vector<Detection> parseDetections(const cv::Mat& output, int frame_width,
                                           int frame_height) const;
    std::string labelFor(int class_id) const;

    static bool loadLabels(const std::string& path, std::vector<std::string>& labels);

private:
    DetectorConfig config_;
    cv::dnn::Net net_;
    std::vector<std::string> labels_;
    bool loaded_{false};
    std::string last_error_;

    cv::Mat blob_;
};

} // namespace sentry

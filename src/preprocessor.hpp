// preprocessor.hpp
#pragma once

#include <opencv2/opencv.hpp>

#include "config.hpp"

namespace sentry {

struct PreparedFrame {
    cv::Mat display;  // BGR, for the overlay and window
    cv::Mat input;    // detector layout (RGB unless disabled)
};

// Resize to the configured size, apply the flip, convert the color order.
// Both outputs share the same geometry, so detector boxes land on the
// display frame without rescaling.
class FramePreprocessor {
public:
    FramePreprocessor(int width, int height, const PreprocessConfig& config);

    bool process(const cv::Mat& raw, PreparedFrame& out);

    int width() const { return width_; }
    int height() const { return height_; }

private:
    int width_;
    int height_;
    PreprocessConfig config_;

    cv::Mat resized_;
};

} // namespace sentry

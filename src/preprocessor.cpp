// preprocessor.cpp
#include "preprocessor.hpp"

namespace sentry {

FramePreprocessor::FramePreprocessor(int width, int height, const PreprocessConfig& config)
    : width_(width), height_(height), config_(config) {
    resized_ = cv::Mat(height, width, CV_8UC3);
}

bool FramePreprocessor::process(const cv::Mat& raw, PreparedFrame& out) {
    if (raw.empty() || raw.type() != CV_8UC3) {
        return false;
    }

    if (raw.cols != width_ || raw.rows != height_) {
        cv::resize(raw, resized_, cv::Size(width_, height_), 0, 0, cv::INTER_LINEAR);
    } else {
        raw.copyTo(resized_);
    }

    switch (config_.flip) {
        case FlipMode::HORIZONTAL: cv::flip(resized_, out.display, 1); break;
        case FlipMode::VERTICAL:   cv::flip(resized_, out.display, 0); break;
        case FlipMode::BOTH:       cv::flip(resized_, out.display, -1); break;
        case FlipMode::NONE:       out.display = resized_.clone(); break;
    }

    if (config_.to_rgb) {
        cv::cvtColor(out.display, out.input, cv::COLOR_BGR2RGB);
    } else {
        out.input = out.display.clone();
    }
    return true;
}

} // namespace sentry

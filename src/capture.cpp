// capture.cpp
#include "capture.hpp"
#include "utils.hpp"
#include <sstream>

namespace sentry {

FrameCapture::FrameCapture(int camera_index, const std::string& backend,
                           int width, int height, int fps)
    : camera_index_(camera_index), backend_(backend),
      width_(width), height_(height), fps_(fps) {
    // Pre-allocate buffers
    buffer_[0] = cv::Mat(height, width, CV_8UC3);
    buffer_[1] = cv::Mat(height, width, CV_8UC3);
}

FrameCapture::~FrameCapture() {
    release();
}

bool FrameCapture::initialize() {
    if (backend_ == "gstreamer") {
        return initializeGStreamer();
    } else if (backend_ == "v4l2") {
        return initializeV4L2(cv::CAP_V4L2);
    } else if (backend_ == "any") {
        return initializeV4L2(cv::CAP_ANY);
    } else {
        last_error_ = "Unknown backend: " + backend_;
        return false;
    }
}

bool FrameCapture::initializeGStreamer() {
    if (pipeline_.empty()) {
        std::stringstream ss;
        ss << "v4l2src device=/dev/video" << camera_index_
           << " ! video/x-raw,width=" << width_
           << ",height=" << height_
           << ",framerate=" << fps_ << "/1"
           << " ! videoconvert"
           << " ! video/x-raw,format=BGR"
           << " ! appsink drop=true max-buffers=1";
        pipeline_ = ss.str();
    }

    Logger::log(Logger::INFO, "GStreamer pipeline: " + pipeline_);

    cap_.open(pipeline_, cv::CAP_GSTREAMER);

    if (!cap_.isOpened()) {
        last_error_ = "Failed to open GStreamer pipeline";
        return false;
    }
    return true;
}

bool FrameCapture::initializeV4L2(int api) {
    cap_.open(camera_index_, api);

    if (!cap_.isOpened()) {
        last_error_ = "Failed to open camera " + std::to_string(camera_index_);
        return false;
    }

    cap_.set(cv::CAP_PROP_FRAME_WIDTH, width_);
    cap_.set(cv::CAP_PROP_FRAME_HEIGHT, height_);
    cap_.set(cv::CAP_PROP_FPS, fps_);

    configureCameraSettings();
    return true;
}

void FrameCapture::configureCameraSettings() {
    // Set buffer size to minimum so grab() returns the newest frame
    cap_.set(cv::CAP_PROP_BUFFERSIZE, 1);

    int actual_w = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH));
    int actual_h = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT));
    if (actual_w != width_ || actual_h != height_) {
        std::ostringstream ss;
        ss << "Camera delivers " << actual_w << "x" << actual_h
           << ", frames will be resized to " << width_ << "x" << height_;
        Logger::log(Logger::WARNING, ss.str());
    }
}

bool FrameCapture::grab(Frame& frame) {
    int buf_idx = current_buffer_.load();
    int next_idx = 1 - buf_idx;

    // Grab directly into pre-allocated buffer
    if (cap_.read(buffer_[next_idx]) && !buffer_[next_idx].empty()) {
        current_buffer_.store(next_idx);
        frame.image = buffer_[next_idx];  // Shallow copy
        frame.timestamp_ms = nowMs();
        frame.frame_id = frame_count_++;
        return true;
    }
    return false;
}

void FrameCapture::setPipeline(const std::string& pipeline) {
    pipeline_ = pipeline;
}

void FrameCapture::release() {
    if (cap_.isOpened()) {
        cap_.release();
    }
}

} // namespace sentry

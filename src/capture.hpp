// capture.hpp
#pragma once

#include <opencv2/opencv.hpp>
#include <cstdint>
#include <string>
#include <atomic>

namespace sentry {

struct Frame {
    cv::Mat image;
    int64_t timestamp_ms = 0;
    uint64_t frame_id = 0;
};

class FrameCapture {
public:
    FrameCapture(int camera_index, const std::string& backend, int width, int height, int fps);
    ~FrameCapture();

    bool initialize();
    // Blocking; false when the camera returned no frame
    bool grab(Frame& frame);
    void setPipeline(const std::string& pipeline);
    void release();

    bool isOpened() const { return cap_.isOpened(); }
    const std::string& lastError() const { return last_error_; }

private:
    int camera_index_;
    std::string backend_;
    std::string pipeline_;
    int width_;
    int height_;
    int fps_;
    uint64_t frame_count_{0};
    std::string last_error_;

    cv::VideoCapture cap_;
    cv::Mat buffer_[2];  // Double buffering
    std::atomic<int> current_buffer_{0};

    bool initializeGStreamer();
    bool initializeV4L2(int api);
    void configureCameraSettings();
};

} // namespace sentry

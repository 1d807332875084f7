// overlay.hpp
#pragma once

#include <opencv2/opencv.hpp>
#include <array>
#include <string>

#include "config.hpp"
#include "control_loop.hpp"
#include "detection.hpp"
#include "target_evaluator.hpp"

namespace sentry {

// Only writes pixels; nothing drawn here feeds back into control
class Overlay {
public:
    explicit Overlay(const OverlayConfig& config);

    void draw(cv::Mat& frame, const TickReport& report, const CenterZone& zone);

    void drawStats(cv::Mat& frame,
                   float fps,
                   float latency_ms,
                   uint64_t dropped_results,
                   const ActuatorState& actuator);

private:
    cv::Scalar box_color_;
    cv::Scalar target_color_;
    cv::Scalar zone_color_;
    cv::Scalar text_color_;
    cv::Scalar warning_color_;

    void drawZone(cv::Mat& frame, const CenterZone& zone);
    void drawDetection(cv::Mat& frame, const Detection& detection, bool centered);
    void drawWarning(cv::Mat& frame, const std::string& text);

    static cv::Scalar toScalar(const std::array<int, 3>& bgr);
};

} // namespace sentry

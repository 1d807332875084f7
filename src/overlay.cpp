// overlay.cpp
#include "overlay.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace sentry {

Overlay::Overlay(const OverlayConfig& config) {
    box_color_ = toScalar(config.box_color);
    target_color_ = toScalar(config.target_color);
    zone_color_ = toScalar(config.zone_color);
    text_color_ = toScalar(config.text_color);
    warning_color_ = toScalar(config.warning_color);
}

cv::Scalar Overlay::toScalar(const std::array<int, 3>& bgr) {
    return cv::Scalar(bgr[0], bgr[1], bgr[2]);
}

void Overlay::draw(cv::Mat& frame, const TickReport& report, const CenterZone& zone) {
    drawZone(frame, zone);

    if (report.has_result) {
        const auto& detections = report.result.detections;
        for (size_t i = 0; i < detections.size(); i++) {
            bool centered = i < report.assessment.centered.size() && report.assessment.centered[i];
            drawDetection(frame, detections[i], centered);
        }
    }

    if (report.halt) {
        drawWarning(frame, "TARGET CENTERED - SWEEP HALTED");
    } else if (!report.actuator.running) {
        drawWarning(frame, "HALTED - press r to resume");
    }
}

void Overlay::drawZone(cv::Mat& frame, const CenterZone& zone) {
    cv::Point tl(static_cast<int>(zone.x_min * frame.cols), static_cast<int>(zone.y_min * frame.rows));
    cv::Point br(static_cast<int>(zone.x_max * frame.cols), static_cast<int>(zone.y_max * frame.rows));
    cv::rectangle(frame, tl, br, zone_color_, 1, cv::LINE_AA);
}

void Overlay::drawDetection(cv::Mat& frame, const Detection& detection, bool centered) {
    cv::Scalar color = centered ? target_color_ : box_color_;
    int thickness = centered ? 3 : 2;

    cv::Rect box(static_cast<int>(detection.box.x), static_cast<int>(detection.box.y),
                 static_cast<int>(detection.box.width), static_cast<int>(detection.box.height));
    cv::rectangle(frame, box, color, thickness);

    // Draw centroid
    cv::Point center(box.x + box.width / 2, box.y + box.height / 2);
    cv::drawMarker(frame, center, color, cv::MARKER_CROSS, 8, 1);

    const Category* top = detection.top();
    if (!top) return;

    std::stringstream ss;
    ss << top->name << " (" << std::fixed << std::setprecision(2) << top->score << ")";

    cv::Point text_pos(box.x + 4, std::max(12, box.y - 6));
    cv::putText(frame, ss.str(), text_pos, cv::FONT_HERSHEY_SIMPLEX,
                0.5, color, 1, cv::LINE_AA);
}

void Overlay::drawWarning(cv::Mat& frame, const std::string& text) {
    // Semi-transparent banner across the bottom
    cv::Rect banner(0, frame.rows - 40, frame.cols, 40);
    cv::Mat overlay = frame.clone();
    cv::rectangle(overlay, banner, warning_color_, -1);
    cv::addWeighted(overlay, 0.5, frame, 0.5, 0, frame);

    int baseline = 0;
    cv::Size size = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, 0.7, 2, &baseline);
    cv::Point text_pos((frame.cols - size.width) / 2, frame.rows - 40 + (40 + size.height) / 2);
    cv::putText(frame, text, text_pos, cv::FONT_HERSHEY_SIMPLEX,
                0.7, text_color_, 2, cv::LINE_AA);
}

void Overlay::drawStats(cv::Mat& frame,
                        float fps,
                        float latency_ms,
                        uint64_t dropped_results,
                        const ActuatorState& actuator) {

    // Background for text
    cv::Rect bg_rect(5, 5, 210, 85);
    cv::Mat overlay = frame.clone();
    cv::rectangle(overlay, bg_rect, cv::Scalar(0, 0, 0), -1);
    cv::addWeighted(overlay, 0.5, frame, 0.5, 0, frame);

    // Draw stats text
    cv::Point text_pos(10, 20);

    std::stringstream ss;
    ss << "FPS: " << std::fixed << std::setprecision(1) << fps;
    cv::putText(frame, ss.str(), text_pos, cv::FONT_HERSHEY_SIMPLEX,
                0.5, text_color_, 1, cv::LINE_AA);

    text_pos.y += 20;
    ss.str("");
    ss << "Loop: " << std::fixed << std::setprecision(1) << latency_ms << " ms";
    cv::putText(frame, ss.str(), text_pos, cv::FONT_HERSHEY_SIMPLEX,
                0.5, text_color_, 1, cv::LINE_AA);

    text_pos.y += 20;
    ss.str("");
    ss << "Dropped results: " << dropped_results;
    cv::putText(frame, ss.str(), text_pos, cv::FONT_HERSHEY_SIMPLEX,
                0.5, text_color_, 1, cv::LINE_AA);

    text_pos.y += 20;
    ss.str("");
    ss << "Servo: " << std::fixed << std::setprecision(0) << actuator.angle << " deg "
       << (actuator.running ? (actuator.direction == SweepDirection::FORWARD ? ">>" : "<<")
                            : "HALT");
    cv::putText(frame, ss.str(), text_pos, cv::FONT_HERSHEY_SIMPLEX,
                0.5, actuator.running ? text_color_ : warning_color_, 1, cv::LINE_AA);
}

} // namespace sentry

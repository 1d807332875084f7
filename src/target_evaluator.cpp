// target_evaluator.cpp
#include "target_evaluator.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace sentry {

TargetEvaluator::TargetEvaluator(const CenterZone& zone, int frame_width, int frame_height,
                                 std::vector<std::string> target_classes)
    : zone_(zone), frame_width_(frame_width), frame_height_(frame_height),
      target_classes_(std::move(target_classes)) {
    if (frame_width_ <= 0 || frame_height_ <= 0) {
        throw std::invalid_argument("frame size must be positive");
    }
    if (zone_.x_min > zone_.x_max || zone_.y_min > zone_.y_max) {
        throw std::invalid_argument("center zone min must not exceed max");
    }
}

bool TargetEvaluator::isCentered(const BoundingBox& box) const {
    double cx = (box.x + box.width / 2.0) / frame_width_;
    double cy = (box.y + box.height / 2.0) / frame_height_;
    return zone_.contains(cx, cy);
}

bool TargetEvaluator::isTargetClass(const Detection& detection) const {
    if (target_classes_.empty()) return true;

    const Category* top = detection.top();
    if (!top) return false;
    return std::find(target_classes_.begin(), target_classes_.end(), top->name) !=
           target_classes_.end();
}

TargetAssessment TargetEvaluator::evaluate(const DetectionResult& result) const {
    TargetAssessment assessment;
    assessment.centered.reserve(result.detections.size());

    for (size_t i = 0; i < result.detections.size(); i++) {
        const Detection& d = result.detections[i];
        bool centered = isCentered(d.box);
        assessment.centered.push_back(centered);

        if (centered && isTargetClass(d) && !assessment.halt) {
            assessment.halt = true;
            assessment.target_index = static_cast<int>(i);
        }
    }
    return assessment;
}

} // namespace sentry

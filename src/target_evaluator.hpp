// target_evaluator.hpp
#pragma once

#include <string>
#include <vector>

#include "detection.hpp"

namespace sentry {

// Fractional window of the frame, bounds inclusive
struct CenterZone {
    double x_min = 0.4;
    double x_max = 0.6;
    double y_min = 0.4;
    double y_max = 0.6;

    bool contains(double fx, double fy) const {
        return fx >= x_min && fx <= x_max && fy >= y_min && fy <= y_max;
    }
};

struct TargetAssessment {
    bool halt = false;
    std::vector<bool> centered;  // one per detection, same order
    int target_index = -1;       // first detection that raised the halt
};

class TargetEvaluator {
public:
    // An empty class list means any category may halt the sweep
    TargetEvaluator(const CenterZone& zone, int frame_width, int frame_height,
                    std::vector<std::string> target_classes = {});

    bool isCentered(const BoundingBox& box) const;
    bool isTargetClass(const Detection& detection) const;

    TargetAssessment evaluate(const DetectionResult& result) const;

    const CenterZone& zone() const { return zone_; }
    const std::vector<std::string>& targetClasses() const { return target_classes_; }

private:
    CenterZone zone_;
    int frame_width_;
    int frame_height_;
    std::vector<std::string> target_classes_;
};

} // namespace sentry

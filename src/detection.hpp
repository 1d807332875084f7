// detection.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sentry {

// Source-frame pixel coordinates
struct BoundingBox {
    float x = 0;
    float y = 0;
    float width = 0;
    float height = 0;
};

struct Category {
    std::string name;
    int index = -1;
    float score = 0;
};

struct Detection {
    BoundingBox box;
    std::vector<Category> categories;  // ranked, best first

    // Only the top-ranked category is used downstream
    const Category* top() const {
        return categories.empty() ? nullptr : &categories.front();
    }
    float topScore() const {
        return categories.empty() ? 0.0f : categories.front().score;
    }
};

struct DetectionResult {
    std::vector<Detection> detections;
    int64_t timestamp_ms = 0;  // capture time of the frame it was computed from
};

// Sorts by top score (descending), drops everything under score_threshold
// and keeps at most max_results entries (max_results <= 0 keeps all).
std::vector<Detection> filterDetections(std::vector<Detection> detections,
                                        float score_threshold,
                                        int max_results);

} // namespace sentry

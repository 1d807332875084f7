// detection.cpp
#include "detection.hpp"
#include <algorithm>

namespace sentry {

std::vector<Detection> filterDetections(std::vector<Detection> detections,
                                        float score_threshold,
                                        int max_results) {
    detections.erase(
        std::remove_if(detections.begin(), detections.end(),
                       [score_threshold](const Detection& d) {
                           return d.categories.empty() || d.topScore() < score_threshold;
                       }),
        detections.end());

    std::stable_sort(detections.begin(), detections.end(),
                     [](const Detection& a, const Detection& b) {
                         return a.topScore() > b.topScore();
                     });

    if (max_results > 0 && detections.size() > static_cast<size_t>(max_results)) {
        detections.resize(max_results);
    }
    return detections;
}

} // namespace sentry

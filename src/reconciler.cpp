// reconciler.cpp
#include "reconciler.hpp"
#include <stdexcept>
#include <utility>

namespace sentry {

DrainPolicy parseDrainPolicy(const std::string& name) {
    if (name == "oldest") return DrainPolicy::KEEP_OLDEST;
    if (name == "newest") return DrainPolicy::KEEP_NEWEST;
    throw std::invalid_argument("Unknown drain policy: " + name + " (expected oldest|newest)");
}

const char* drainPolicyName(DrainPolicy policy) {
    return policy == DrainPolicy::KEEP_NEWEST ? "newest" : "oldest";
}

ResultReconciler::ResultReconciler(size_t capacity, DrainPolicy policy, int fps_window)
    : capacity_(capacity), policy_(policy), fps_(fps_window) {}

void ResultReconciler::onResult(DetectionResult result, int64_t timestamp_ms) {
    onResult(std::move(result), timestamp_ms, Clock::now());
}

void ResultReconciler::onResult(DetectionResult result, int64_t timestamp_ms,
                                Clock::time_point now) {
    result.timestamp_ms = timestamp_ms;

    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity_ > 0 && pending_.size() >= capacity_) {
        pending_.pop_front();
        evicted_++;
        dropped_++;
    }
    pending_.push_back(std::move(result));
    fps_.onCallback(now);
}

bool ResultReconciler::drain(DetectionResult& out) {
    std::deque<DetectionResult> taken;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_.empty()) {
            return false;
        }
        taken.swap(pending_);
        consumed_++;
        dropped_ += taken.size() - 1;
    }

    if (policy_ == DrainPolicy::KEEP_NEWEST) {
        out = std::move(taken.back());
    } else {
        out = std::move(taken.front());
    }
    return true;
}

ReconcilerStats ResultReconciler::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ReconcilerStats s;
    s.processed = fps_.callbacks();
    s.consumed = consumed_;
    s.dropped = dropped_;
    s.evicted = evicted_;
    s.pending = pending_.size();
    s.fps = fps_.fps();
    return s;
}

float ResultReconciler::fps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fps_.fps();
}

uint64_t ResultReconciler::droppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

size_t ResultReconciler::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace sentry

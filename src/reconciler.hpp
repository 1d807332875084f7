// reconciler.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

#include "detection.hpp"
#include "frame_rate.hpp"

namespace sentry {

// Which pending entry drain() hands to the main loop; the rest are dropped
enum class DrainPolicy {
    KEEP_OLDEST = 0,
    KEEP_NEWEST = 1
};

DrainPolicy parseDrainPolicy(const std::string& name);
const char* drainPolicyName(DrainPolicy policy);

struct ReconcilerStats {
    uint64_t processed = 0;  // callbacks seen
    uint64_t consumed = 0;   // results handed out by drain()
    uint64_t dropped = 0;    // discarded by drain() or evicted on overflow
    uint64_t evicted = 0;
    size_t pending = 0;
    float fps = 0;
};

/**
 * Handoff point between the detector worker and the main loop.
 *
 * onResult() runs on the worker: it appends under the lock and returns.
 * drain() runs once per tick on the main loop: it swaps the whole pending
 * queue out under the same lock, keeps one entry according to the policy
 * and counts the others as dropped.
 *
 * The pending queue holds at most `capacity` entries (0 = unbounded).
 * Appending to a full queue evicts the oldest entry.
 */
class ResultReconciler {
public:
    using Clock = FrameRateEstimator::Clock;

    ResultReconciler(size_t capacity, DrainPolicy policy, int fps_window);

    void onResult(DetectionResult result, int64_t timestamp_ms);
    void onResult(DetectionResult result, int64_t timestamp_ms, Clock::time_point now);

    // False when nothing arrived since the previous drain
    bool drain(DetectionResult& out);

    ReconcilerStats stats() const;
    float fps() const;
    uint64_t droppedCount() const;
    size_t pendingCount() const;

    DrainPolicy policy() const { return policy_; }
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    const DrainPolicy policy_;

    mutable std::mutex mutex_;
    std::deque<DetectionResult> pending_;
    FrameRateEstimator fps_;
    uint64_t consumed_{0};
    uint64_t dropped_{0};
    uint64_t evicted_{0};
};

} // namespace sentry

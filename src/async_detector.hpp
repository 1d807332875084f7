// async_detector.hpp
#pragma once

#include <opencv2/core.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

#include "detection.hpp"
#include "detector.hpp"
#include "lock_free_queue.hpp"

namespace sentry {

/**
 * Runs an InferenceEngine on its own worker thread.
 *
 * submit() is called from the main loop only and never blocks: the frame is
 * copied into a small SPSC queue, or dropped (and counted) when the worker
 * is still busy with earlier submissions. Results are handed to the
 * callback on the worker thread, in submission order.
 */
class AsyncDetector {
public:
    using ResultCallback = std::function<void(DetectionResult result, int64_t timestamp_ms)>;

    AsyncDetector(std::unique_ptr<InferenceEngine> engine, size_t queue_size,
                  ResultCallback callback);
    ~AsyncDetector();

    AsyncDetector(const AsyncDetector&) = delete;
    AsyncDetector& operator=(const AsyncDetector&) = delete;

    void start();
    // Joins the worker, then discards submissions it did not reach
    void stop();

    // False when the submission was dropped
    bool submit(const cv::Mat& frame, int64_t timestamp_ms);

    bool isRunning() const { return running_; }
    uint64_t submitted() const { return submitted_; }
    uint64_t droppedSubmissions() const { return dropped_; }
    uint64_t completed() const { return completed_; }
    uint64_t failures() const { return failures_; }

private:
    struct Job {
        cv::Mat frame;
        int64_t timestamp_ms = 0;
    };

    void workerLoop();

    std::unique_ptr<InferenceEngine> engine_;
    ResultCallback callback_;
    LockFreeQueue<Job> queue_;

    std::thread worker_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failures_{0};
};

} // namespace sentry

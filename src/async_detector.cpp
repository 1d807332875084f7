// async_detector.cpp
#include "async_detector.hpp"
#include "utils.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace sentry {

AsyncDetector::AsyncDetector(std::unique_ptr<InferenceEngine> engine, size_t queue_size,
                             ResultCallback callback)
    : engine_(std::move(engine)), callback_(std::move(callback)), queue_(queue_size) {
    if (!engine_) {
        throw std::invalid_argument("AsyncDetector needs an inference engine");
    }
    if (!callback_) {
        throw std::invalid_argument("AsyncDetector needs a result callback");
    }
}

AsyncDetector::~AsyncDetector() {
    stop();
}

void AsyncDetector::start() {
    if (running_) return;
    running_ = true;
    worker_ = std::thread(&AsyncDetector::workerLoop, this);
}

void AsyncDetector::stop() {
    running_ = false;
    if (worker_.joinable()) {
        worker_.join();
    }

    // Worker is gone, so this thread may act as the consumer
    Job stale;
    while (queue_.pop(stale)) {}
}

bool AsyncDetector::submit(const cv::Mat& frame, int64_t timestamp_ms) {
    if (!running_) {
        dropped_++;
        return false;
    }

    Job job;
    job.frame = frame.clone();  // the caller reuses its buffers
    job.timestamp_ms = timestamp_ms;

    if (!queue_.push(std::move(job))) {
        dropped_++;
        return false;
    }
    submitted_++;
    return true;
}

void AsyncDetector::workerLoop() {
    Job job;

    while (running_) {
        if (!queue_.pop(job)) {
            std::this_thread::sleep_for(std::chrono::microseconds(500));
            continue;
        }

        DetectionResult result;
        result.timestamp_ms = job.timestamp_ms;
        try {
            result.detections = engine_->infer(job.frame);
        } catch (const std::exception& e) {
            failures_++;
            Logger::log(Logger::ERROR, std::string("Inference failed, frame dropped: ") + e.what());
            continue;
        }

        completed_++;
        callback_(std::move(result), job.timestamp_ms);
    }
}

} // namespace sentry

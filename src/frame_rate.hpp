// frame_rate.hpp
#pragma once

#include <chrono>
#include <cstdint>

namespace sentry {

/**
 * Windowed frame-rate estimate over detector callbacks.
 * Every window_size callbacks the rate is recomputed as
 * window_size / seconds since the previous window start, and the window
 * restarts. In between, fps() keeps returning the last computed value.
 */
class FrameRateEstimator {
public:
    using Clock = std::chrono::steady_clock;

    explicit FrameRateEstimator(int window_size, Clock::time_point start = Clock::now());

    // Returns true when this callback closed a window and fps() changed
    bool onCallback(Clock::time_point now);

    float fps() const { return fps_; }
    int windowSize() const { return window_size_; }
    uint64_t callbacks() const { return callbacks_; }

private:
    int window_size_;
    uint64_t callbacks_{0};
    Clock::time_point window_start_;
    float fps_{0};
};

} // namespace sentry

// frame_rate.cpp
#include "frame_rate.hpp"
#include <stdexcept>

namespace sentry {

FrameRateEstimator::FrameRateEstimator(int window_size, Clock::time_point start)
    : window_size_(window_size), window_start_(start) {
    if (window_size_ <= 0) {
        throw std::invalid_argument("fps window size must be positive");
    }
}

bool FrameRateEstimator::onCallback(Clock::time_point now) {
    callbacks_++;
    if (callbacks_ % window_size_ != 0) {
        return false;
    }

    double elapsed = std::chrono::duration<double>(now - window_start_).count();
    if (elapsed > 0) {
        fps_ = static_cast<float>(window_size_ / elapsed);
    }
    window_start_ = now;
    return true;
}

} // namespace sentry

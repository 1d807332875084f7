// utils.hpp
#pragma once

#include <chrono>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace sentry {

class PerfStats {
public:
    std::atomic<float> fps{0};
    std::atomic<int64_t> capture_time{0};  // microseconds
    std::atomic<int64_t> process_time{0};  // microseconds
    std::atomic<int64_t> render_time{0};   // microseconds
    std::atomic<int> dropped_frames{0};      // failed grabs
    std::atomic<int> dropped_submissions{0}; // detector queue full
    std::atomic<uint64_t> dropped_results{0};
    std::atomic<uint64_t> ticks{0};

    float getLatency() const {
        return (capture_time + process_time + render_time) / 1000.0f;  // Convert to ms
    }
};

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    void reset() {
        start_ = std::chrono::steady_clock::now();
    }

    double elapsed_ms() const {
        auto end = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(end - start_).count();
    }

    int64_t elapsed_us() const {
        auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// Milliseconds on the steady clock, used to tag frames and results
int64_t nowMs();

// Thread-safe logger; the detector worker logs through it too
class Logger {
public:
    enum Level {
        DEBUG = 0,
        INFO = 1,
        WARNING = 2,
        ERROR = 3
    };

    static void log(Level level, const std::string& message);
    static void setLevel(Level level) { min_level_ = level; }
    static Level getLevel() { return min_level_; }
    static bool enabled(Level level) { return level >= min_level_; }

    // "debug" | "info" | "warning"/"warn" | "error"; throws std::invalid_argument
    static Level parseLevel(const std::string& name);

private:
    static std::atomic<Level> min_level_;
    static std::mutex mutex_;
};

} // namespace sentry

// utils.cpp
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace sentry {

std::atomic<Logger::Level> Logger::min_level_{Logger::INFO};
std::mutex Logger::mutex_;

int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

void Logger::log(Level level, const std::string& message) {
    if (level < min_level_) return;

    const char* level_str[] = {"DEBUG", "INFO", "WARN", "ERROR"};

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream& out = (level >= WARNING) ? std::cerr : std::cout;
    out << "[" << std::put_time(&local_tm, "%H:%M:%S");
    out << "." << std::setfill('0') << std::setw(3) << ms.count();
    out << "] [" << level_str[level] << "] " << message << std::endl;
}

Logger::Level Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return DEBUG;
    if (lower == "info") return INFO;
    if (lower == "warning" || lower == "warn") return WARNING;
    if (lower == "error") return ERROR;

    throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace sentry

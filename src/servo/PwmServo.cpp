#include "servo/PwmServo.hpp"
#include "utils.hpp"

#include <sys/stat.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <thread>
#include <utility>

namespace sentry { namespace servo {

namespace {

bool pathExists(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

} // namespace

PwmServo::PwmServo(std::string chip_path, unsigned int channel,
                   int min_pulse_us, int max_pulse_us, double initial_angle)
    : chip_path_(std::move(chip_path)), channel_(channel),
      min_pulse_us_(min_pulse_us), max_pulse_us_(max_pulse_us),
      initial_angle_(initial_angle) {
    pwm_path_ = chip_path_ + "/pwm" + std::to_string(channel_);
}

PwmServo::~PwmServo() { release(); }

uint32_t PwmServo::dutyCycleNs(double degrees, int min_pulse_us, int max_pulse_us) {
    double clamped = std::min(180.0, std::max(0.0, degrees));
    double pulse_us = min_pulse_us + (max_pulse_us - min_pulse_us) * clamped / 180.0;
    return static_cast<uint32_t>(pulse_us * 1000.0 + 0.5);
}

std::string PwmServo::name() const {
    return "pwm:" + pwm_path_;
}

bool PwmServo::writeFile(const std::string& path, const std::string& value) {
    std::ofstream f(path);
    if (!f.is_open()) {
        last_error_ = "open " + path + ": " + std::strerror(errno);
        return false;
    }
    f << value;
    f.flush();
    if (!f) {
        last_error_ = "write " + path + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

bool PwmServo::waitForChannel(int timeout_ms) {
    // udev may need a moment to fix permissions after export
    for (int waited = 0; waited < timeout_ms; waited += 10) {
        if (pathExists(pwm_path_ + "/duty_cycle")) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pathExists(pwm_path_ + "/duty_cycle");
}

bool PwmServo::initialize() {
    if (ready_) return true;

    if (!pathExists(chip_path_)) {
        last_error_ = "PWM chip not found: " + chip_path_;
        return false;
    }

    if (!pathExists(pwm_path_)) {
        if (!writeFile(chip_path_ + "/export", std::to_string(channel_))) return false;
        if (!waitForChannel(500)) {
            last_error_ = "PWM channel did not appear: " + pwm_path_;
            return false;
        }
    }

    // period must be set before a duty cycle larger than the old period
    if (!writeFile(pwm_path_ + "/period", std::to_string(PERIOD_NS))) return false;
    uint32_t duty = dutyCycleNs(initial_angle_, min_pulse_us_, max_pulse_us_);
    if (!writeFile(pwm_path_ + "/duty_cycle", std::to_string(duty))) return false;
    if (!writeFile(pwm_path_ + "/enable", "1")) return false;

    ready_ = true;
    return true;
}

void PwmServo::release() {
    if (!ready_) return;
    if (!writeFile(pwm_path_ + "/enable", "0")) {
        Logger::log(Logger::WARNING, "Could not disable PWM output: " + last_error_);
    }
    ready_ = false;
}

bool PwmServo::setAngle(double degrees) {
    if (!ready_) {
        last_error_ = "not initialized";
        return false;
    }
    uint32_t duty = dutyCycleNs(degrees, min_pulse_us_, max_pulse_us_);
    return writeFile(pwm_path_ + "/duty_cycle", std::to_string(duty));
}

}} // namespace

#pragma once
#include <cstdint>
#include <string>

#include "servo/ServoDriver.hpp"

namespace sentry { namespace servo {

/**
 * Servo on a Linux sysfs PWM channel (e.g. Raspberry Pi dtoverlay=pwm).
 * - initialize() exports the channel, sets a 20 ms period (50 Hz) and enables it.
 * - setAngle() maps 0..180 deg linearly onto [min_pulse_us, max_pulse_us].
 * - release() disables the output; the channel stays exported.
 */
class PwmServo : public ServoDriver {
public:
    static constexpr uint32_t PERIOD_NS = 20000000;  // 20 ms

    PwmServo(std::string chip_path, unsigned int channel,
             int min_pulse_us = 500, int max_pulse_us = 2500,
             double initial_angle = 0.0);
    ~PwmServo() override;

    bool initialize() override;
    void release() override;
    bool isReady() const override { return ready_; }

    bool setAngle(double degrees) override;

    std::string name() const override;
    const std::string& lastError() const override { return last_error_; }

    // Pulse width for an angle, clamped to 0..180
    static uint32_t dutyCycleNs(double degrees, int min_pulse_us, int max_pulse_us);

private:
    std::string chip_path_;
    unsigned int channel_;
    std::string pwm_path_;
    int min_pulse_us_;
    int max_pulse_us_;
    double initial_angle_;
    bool ready_{false};
    std::string last_error_;

    bool writeFile(const std::string& path, const std::string& value);
    bool waitForChannel(int timeout_ms);
};

}} // namespace

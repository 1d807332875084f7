// actuator.hpp
#pragma once

#include <chrono>
#include <cstdint>

#include "servo/ServoDriver.hpp"

namespace sentry {

enum class SweepDirection {
    FORWARD = 1,
    REVERSE = -1
};

struct ActuatorState {
    double angle = 0;  // degrees, always within [MIN_ANGLE, MAX_ANGLE]
    SweepDirection direction = SweepDirection::FORWARD;
    bool running = true;
};

/**
 * Sweeping servo that stops for good once a target is acquired.
 *
 * Sweeping: every tick moves the angle by one step in the current
 * direction, clamped to [0, 180]. Touching a boundary flips the direction.
 * The new angle is written to the driver and the settle delay is applied.
 *
 * Halted: entered on the first tick with halt_signal == true. No further
 * angle writes. Only reset() leaves it.
 */
class ActuatorController {
public:
    static constexpr double MIN_ANGLE = 0.0;
    static constexpr double MAX_ANGLE = 180.0;

    ActuatorController(servo::ServoDriver& driver, double step_deg,
                       std::chrono::milliseconds settle_delay,
                       double start_angle = MIN_ANGLE);

    // One loop tick. Returns true if the sweep advanced (and a write was attempted).
    bool tick(bool halt_signal);

    // Operator reset: Halted -> Sweeping from the current angle and direction
    void reset();

    const ActuatorState& state() const { return state_; }
    bool halted() const { return !state_.running; }

    uint64_t writeCount() const { return writes_; }
    uint64_t writeFailures() const { return write_failures_; }
    int consecutiveWriteFailures() const { return consecutive_failures_; }

    // Next sweep state for a given step; running flag is left untouched
    static ActuatorState advance(ActuatorState state, double step_deg);

private:
    servo::ServoDriver& driver_;
    double step_;
    std::chrono::milliseconds settle_delay_;
    ActuatorState state_;

    uint64_t writes_{0};
    uint64_t write_failures_{0};
    int consecutive_failures_{0};
};

} // namespace sentry

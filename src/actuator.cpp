// actuator.cpp
#include "actuator.hpp"
#include "utils.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace sentry {

ActuatorController::ActuatorController(servo::ServoDriver& driver, double step_deg,
                                       std::chrono::milliseconds settle_delay,
                                       double start_angle)
    : driver_(driver), step_(step_deg), settle_delay_(settle_delay) {
    if (step_ <= 0 || step_ > MAX_ANGLE) {
        throw std::invalid_argument("sweep step must be in (0, 180]");
    }
    if (start_angle < MIN_ANGLE || start_angle > MAX_ANGLE) {
        throw std::invalid_argument("start angle must be in [0, 180]");
    }
    state_.angle = start_angle;
    // Starting on the upper boundary sweeps back
    if (start_angle >= MAX_ANGLE) {
        state_.direction = SweepDirection::REVERSE;
    }
}

ActuatorState ActuatorController::advance(ActuatorState state, double step_deg) {
    double dir = static_cast<double>(static_cast<int>(state.direction));
    state.angle = std::min(MAX_ANGLE, std::max(MIN_ANGLE, state.angle + step_deg * dir));

    if (state.angle >= MAX_ANGLE) {
        state.direction = SweepDirection::REVERSE;
    } else if (state.angle <= MIN_ANGLE) {
        state.direction = SweepDirection::FORWARD;
    }
    return state;
}

bool ActuatorController::tick(bool halt_signal) {
    if (!state_.running) {
        return false;
    }

    if (halt_signal) {
        state_.running = false;
        std::ostringstream ss;
        ss << "Sweep halted at " << state_.angle << " deg";
        Logger::log(Logger::DEBUG, ss.str());
        return false;
    }

    state_ = advance(state_, step_);

    if (driver_.setAngle(state_.angle)) {
        writes_++;
        consecutive_failures_ = 0;
    } else {
        write_failures_++;
        consecutive_failures_++;
        Logger::log(Logger::WARNING, "Servo write failed (" + driver_.name() + "): " +
                    driver_.lastError());
    }

    if (settle_delay_.count() > 0) {
        std::this_thread::sleep_for(settle_delay_);
    }
    return true;
}

void ActuatorController::reset() {
    if (state_.running) return;
    state_.running = true;
    consecutive_failures_ = 0;
    Logger::log(Logger::INFO, "Actuator reset, sweeping resumed");
}

} // namespace sentry

#include "servo/SimulatedServo.hpp"
#include "utils.hpp"

#include <sstream>

namespace sentry { namespace servo {

bool SimulatedServo::initialize() {
    ready_ = true;
    Logger::log(Logger::INFO, "Servo output disabled, using simulated servo");
    return true;
}

void SimulatedServo::release() {
    ready_ = false;
}

bool SimulatedServo::setAngle(double degrees) {
    if (!ready_) {
        last_error_ = "not initialized";
        return false;
    }
    last_angle_ = degrees;
    writes_++;

    if (Logger::enabled(Logger::DEBUG)) {
        std::ostringstream ss;
        ss << "servo -> " << degrees << " deg";
        Logger::log(Logger::DEBUG, ss.str());
    }
    return true;
}

}} // namespace

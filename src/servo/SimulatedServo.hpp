#pragma once
#include <cstddef>
#include <string>

#include "servo/ServoDriver.hpp"

namespace sentry { namespace servo {

// Stand-in for the hardware when running with --no-servo; keeps the last command
class SimulatedServo : public ServoDriver {
public:
    SimulatedServo() = default;

    bool initialize() override;
    void release() override;
    bool isReady() const override { return ready_; }

    bool setAngle(double degrees) override;

    std::string name() const override { return "simulated"; }
    const std::string& lastError() const override { return last_error_; }

    double lastAngle() const { return last_angle_; }
    size_t writeCount() const { return writes_; }

private:
    bool ready_{false};
    double last_angle_{0};
    size_t writes_{0};
    std::string last_error_;
};

}} // namespace

#pragma once
#include <string>

namespace sentry { namespace servo {

/**
 * Angle setter for a hobby servo.
 * setAngle() is fire-and-forget: it returns once the command is written,
 * the horn is assumed to arrive within one settle delay.
 */
class ServoDriver {
public:
    virtual ~ServoDriver() = default;

    virtual bool initialize() = 0;
    virtual void release() = 0;
    virtual bool isReady() const = 0;

    // degrees, 0..180
    virtual bool setAngle(double degrees) = 0;

    virtual std::string name() const = 0;
    virtual const std::string& lastError() const = 0;
};

}} // namespace

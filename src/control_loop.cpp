// control_loop.cpp
#include "control_loop.hpp"

#include <stdexcept>

namespace sentry {

const char* fatalSourceName(FatalSource source) {
    switch (source) {
        case FatalSource::CAMERA: return "camera";
        case FatalSource::ACTUATOR: return "actuator";
        case FatalSource::NONE: break;
    }
    return "none";
}

ControlLoop::ControlLoop(ResultReconciler& reconciler, const TargetEvaluator& evaluator,
                         ActuatorController& actuator, LoopLimits limits)
    : reconciler_(reconciler), evaluator_(evaluator), actuator_(actuator), limits_(limits) {
    if (limits_.max_frame_failures <= 0 || limits_.max_write_failures <= 0) {
        throw std::invalid_argument("loop failure limits must be positive");
    }
}

TickReport ControlLoop::step(bool frame_ok) {
    TickReport report;
    report.tick = ++ticks_;

    if (!frame_ok) {
        skipped_++;
        report.skipped = true;
        report.actuator = actuator_.state();
        if (++frame_failures_ >= limits_.max_frame_failures) {
            report.fatal = FatalSource::CAMERA;
        }
        return report;
    }
    frame_failures_ = 0;

    report.has_result = reconciler_.drain(report.result);
    if (report.has_result) {
        report.assessment = evaluator_.evaluate(report.result);
        report.halt = report.assessment.halt;
    }

    report.moved = actuator_.tick(report.halt);
    report.actuator = actuator_.state();
    if (actuator_.consecutiveWriteFailures() >= limits_.max_write_failures) {
        report.fatal = FatalSource::ACTUATOR;
    }
    return report;
}

} // namespace sentry

// control_loop.hpp
#pragma once

#include <cstdint>

#include "actuator.hpp"
#include "detection.hpp"
#include "reconciler.hpp"
#include "target_evaluator.hpp"

namespace sentry {

// Collaborator whose repeated failures ended the run
enum class FatalSource {
    NONE = 0,
    CAMERA = 1,
    ACTUATOR = 2
};

const char* fatalSourceName(FatalSource source);

struct LoopLimits {
    int max_frame_failures = 100;  // consecutive failed grabs
    int max_write_failures = 10;   // consecutive failed servo writes
};

struct TickReport {
    uint64_t tick = 0;
    bool skipped = false;      // frame grab failed, nothing else ran
    bool has_result = false;   // a detection result was drained this tick
    DetectionResult result;
    TargetAssessment assessment;
    bool halt = false;         // halt signal for this tick
    bool moved = false;        // actuator advanced
    ActuatorState actuator;
    FatalSource fatal = FatalSource::NONE;  // set on the tick that reaches a limit
};

/**
 * Per-tick control step of the main loop: drain -> evaluate -> actuate.
 * Capture, submit and render stay with the caller; everything here runs on
 * the main loop thread only.
 */
class ControlLoop {
public:
    ControlLoop(ResultReconciler& reconciler, const TargetEvaluator& evaluator,
                ActuatorController& actuator, LoopLimits limits = LoopLimits());

    // frame_ok == false skips the tick: no drain, no actuator step
    TickReport step(bool frame_ok);

    uint64_t ticks() const { return ticks_; }
    uint64_t skippedTicks() const { return skipped_; }
    int consecutiveFrameFailures() const { return frame_failures_; }
    const LoopLimits& limits() const { return limits_; }

private:
    ResultReconciler& reconciler_;
    const TargetEvaluator& evaluator_;
    ActuatorController& actuator_;
    LoopLimits limits_;

    uint64_t ticks_{0};
    int frame_failures_{0};
    uint64_t skipped_{0};
};

} // namespace sentry

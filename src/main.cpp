#include <iostream>
#include <memory>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <sstream>
#include <yaml-cpp/yaml.h>

#include "actuator.hpp"
#include "async_detector.hpp"
#include "capture.hpp"
#include "config.hpp"
#include "control_loop.hpp"
#include "detector.hpp"
#include "overlay.hpp"
#include "preprocessor.hpp"
#include "reconciler.hpp"
#include "target_evaluator.hpp"
#include "utils.hpp"
#include "servo/PwmServo.hpp"
#include "servo/SimulatedServo.hpp"

using namespace std::chrono;
using namespace sentry;

std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;
    }
}

namespace {

// Reads the file named on the command line and applies the flag overrides
bool buildConfig(const CommandLine& cl, SentryConfig& cfg) {
    YAML::Node file_config;
    try {
        file_config = YAML::LoadFile(cl.config_file);
    } catch (const YAML::BadFile&) {
        Logger::log(Logger::WARNING, "Could not load config file " + cl.config_file +
                    ", using defaults");
    } catch (const YAML::Exception& e) {
        Logger::log(Logger::ERROR, "Config file " + cl.config_file + " is malformed: " + e.what());
        return false;
    }

    try {
        cfg = loadConfig(mergeNodes(file_config, cl.overrides));
        validate(cfg);
    } catch (const std::exception& e) {
        Logger::log(Logger::ERROR, std::string("Invalid configuration: ") + e.what());
        return false;
    }
    return true;
}

void logStatus(const PerfStats& stats, const ResultReconciler& reconciler,
               const ActuatorController& actuator) {
    ReconcilerStats rs = reconciler.stats();
    std::ostringstream ss;
    ss << "[STATS] FPS: " << std::fixed << std::setprecision(1) << rs.fps
       << " | Loop: " << stats.getLatency() << "ms"
       << " | Frame drops: " << stats.dropped_frames
       << " | Submit drops: " << stats.dropped_submissions
       << " | Result drops: " << rs.dropped
       << " | Servo: " << std::setprecision(0) << actuator.state().angle << " deg"
       << (actuator.halted() ? " HALTED" : "");
    Logger::log(Logger::INFO, ss.str());
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cl;
    try {
        cl = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << usage(argv[0]);
        return 1;
    }
    if (cl.help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    SentryConfig cfg;
    if (!buildConfig(cl, cfg)) {
        return 1;
    }
    Logger::setLevel(cfg.logging.level);

    // Signal handling
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Actuator
    std::unique_ptr<servo::ServoDriver> servo_driver;
    if (cfg.servo.enabled) {
        servo_driver = std::make_unique<servo::PwmServo>(cfg.servo.chip, cfg.servo.channel,
                                                         cfg.servo.min_pulse_us,
                                                         cfg.servo.max_pulse_us,
                                                         cfg.servo.start_angle);
    } else {
        servo_driver = std::make_unique<servo::SimulatedServo>();
    }
    if (!servo_driver->initialize()) {
        Logger::log(Logger::ERROR, "Failed to initialize actuator (" + servo_driver->name() +
                    "): " + servo_driver->lastError());
        return 1;
    }

    // Detector
    auto engine = std::make_unique<DnnInferenceEngine>(cfg.detector);
    if (!engine->initialize()) {
        Logger::log(Logger::ERROR, "Failed to initialize detector: " + engine->lastError());
        return 1;
    }

    // Camera
    auto capture = std::make_unique<FrameCapture>(cfg.camera.index, cfg.camera.backend,
                                                  cfg.camera.width, cfg.camera.height,
                                                  cfg.camera.fps);
    if (cfg.camera.backend == "gstreamer" && !cfg.camera.pipeline.empty()) {
        capture->setPipeline(cfg.camera.pipeline);
    }
    if (!capture->initialize()) {
        Logger::log(Logger::ERROR, "Failed to initialize camera: " + capture->lastError());
        return 1;
    }

    auto stats = std::make_shared<PerfStats>();
    ResultReconciler reconciler(cfg.reconciler.pending_capacity, cfg.reconciler.policy,
                                cfg.reconciler.fps_avg_frame_count);
    TargetEvaluator evaluator(cfg.target.zone, cfg.camera.width, cfg.camera.height,
                              cfg.target.classes);
    ActuatorController actuator(*servo_driver, cfg.servo.step,
                                milliseconds(cfg.servo.settle_ms), cfg.servo.start_angle);
    LoopLimits limits;
    limits.max_frame_failures = cfg.camera.max_consecutive_failures;
    limits.max_write_failures = cfg.servo.max_write_failures;
    ControlLoop loop(reconciler, evaluator, actuator, limits);
    FramePreprocessor preprocessor(cfg.camera.width, cfg.camera.height, cfg.preprocess);
    Overlay overlay(cfg.overlay);

    AsyncDetector detector(std::move(engine), cfg.detector.queue_size,
                           [&reconciler](DetectionResult result, int64_t timestamp_ms) {
                               reconciler.onResult(std::move(result), timestamp_ms);
                           });
    detector.start();

    std::ostringstream banner;
    banner << "Starting sentry: " << cfg.camera.width << "x" << cfg.camera.height
           << " camera " << cfg.camera.index << ", servo " << servo_driver->name()
           << ", step " << cfg.servo.step << " deg, settle " << cfg.servo.settle_ms << " ms"
           << ", drain policy " << drainPolicyName(cfg.reconciler.policy);
    Logger::log(Logger::INFO, banner.str());
    Logger::log(Logger::INFO, cfg.overlay.show_window
                ? "Press 'q' to quit, 'r' to resume the sweep, 'p' to pause"
                : "Press Ctrl+C to stop");

    int exit_code = 0;
    Frame frame;
    PreparedFrame prepared;
    auto last_status = steady_clock::now();
    const char* stage = "camera";  // collaborator in use, for error reports

    try {
        while (g_running) {
            Timer tick_timer;

            stage = "camera";
            bool frame_ok = capture->grab(frame);
            stats->capture_time = tick_timer.elapsed_us();

            if (frame_ok) {
                stage = "preprocessor";
                frame_ok = preprocessor.process(frame.image, prepared);
            }

            if (!frame_ok) {
                stats->dropped_frames++;
                TickReport skipped = loop.step(false);
                if (skipped.fatal == FatalSource::CAMERA) {
                    Logger::log(Logger::ERROR, "Camera stopped delivering frames after " +
                                std::to_string(loop.consecutiveFrameFailures()) + " attempts");
                    exit_code = 1;
                    break;
                }
                continue;
            }

            stage = "detector";
            if (!detector.submit(prepared.input, frame.timestamp_ms)) {
                stats->dropped_submissions++;
            }

            stage = "actuator";
            Timer process_timer;
            bool was_halted = actuator.halted();
            TickReport report = loop.step(true);
            stats->process_time = process_timer.elapsed_us();
            stats->dropped_results = reconciler.droppedCount();
            stats->fps = reconciler.fps();
            stats->ticks++;

            if (report.halt && !was_halted) {
                std::ostringstream ss;
                const Detection& d = report.result.detections[report.assessment.target_index];
                ss << "Target centered: " << (d.top() ? d.top()->name : "?")
                   << " score " << std::fixed << std::setprecision(2) << d.topScore()
                   << ", sweep halted at " << std::setprecision(0) << report.actuator.angle
                   << " deg (frame " << report.result.timestamp_ms << " ms)";
                Logger::log(Logger::WARNING, ss.str());
            }

            if (report.fatal == FatalSource::ACTUATOR) {
                Logger::log(Logger::ERROR, "Actuator not responding (" + servo_driver->name() +
                            "): " + servo_driver->lastError());
                exit_code = 1;
                break;
            }

            if (cfg.overlay.show_window) {
                stage = "display";
                Timer render_timer;
                overlay.draw(prepared.display, report, evaluator.zone());
                overlay.drawStats(prepared.display, stats->fps, stats->getLatency(),
                                  stats->dropped_results, report.actuator);
                cv::imshow(cfg.overlay.window_name, prepared.display);

                int key = cv::waitKey(1);
                if (key == 'q' || key == 27) {  // q or ESC
                    g_running = false;
                } else if (key == 'r') {
                    actuator.reset();
                } else if (key == 'p') {  // Pause
                    cv::waitKey(0);
                }
                stats->render_time = render_timer.elapsed_us();
            }

            auto now = steady_clock::now();
            if (cfg.logging.status_interval_ms > 0 &&
                duration_cast<milliseconds>(now - last_status).count() >= cfg.logging.status_interval_ms) {
                logStatus(*stats, reconciler, actuator);
                last_status = now;
            }
        }
    } catch (const cv::Exception& e) {
        Logger::log(Logger::ERROR, std::string("OpenCV error in ") + stage + ": " + e.what());
        exit_code = 1;
    } catch (const std::exception& e) {
        Logger::log(Logger::ERROR, std::string("Unexpected error in ") + stage + ": " + e.what());
        exit_code = 1;
    }

    // Cleanup
    detector.stop();
    capture->release();
    servo_driver->release();
    if (cfg.overlay.show_window) {
        try {
            cv::destroyAllWindows();
        } catch (const cv::Exception& e) {
            Logger::log(Logger::WARNING, std::string("Could not close display: ") + e.what());
        }
    }

    ReconcilerStats rs = reconciler.stats();
    std::ostringstream summary;
    summary << "Shutdown complete: " << stats->ticks << " ticks, "
            << detector.completed() << " inferences, "
            << rs.consumed << " results used, " << rs.dropped << " dropped, "
            << detector.droppedSubmissions() << " submissions dropped, "
            << stats->dropped_frames << " failed grabs";
    Logger::log(Logger::INFO, summary.str());
    return exit_code;
}

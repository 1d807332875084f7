// config.hpp
#pragma once

#include <yaml-cpp/yaml.h>
#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "reconciler.hpp"
#include "target_evaluator.hpp"
#include "utils.hpp"

namespace sentry {

enum class FlipMode {
    NONE = 0,
    HORIZONTAL = 1,
    VERTICAL = 2,
    BOTH = 3
};

FlipMode parseFlipMode(const std::string& name);

struct CameraConfig {
    int index = 0;
    int width = 640;
    int height = 480;
    int fps = 30;
    std::string backend = "v4l2";  // v4l2 | gstreamer | any
    std::string pipeline = "";     // custom GStreamer pipeline
    int max_consecutive_failures = 100;
};

struct PreprocessConfig {
    FlipMode flip = FlipMode::HORIZONTAL;
    bool to_rgb = true;
};

struct DetectorConfig {
    std::string model_path = "models/ssd_mobilenet_v2.pb";
    std::string config_path = "";   // e.g. .pbtxt for TensorFlow graphs
    std::string labels_path = "";
    int max_results = 3;
    float score_threshold = 0.25f;
    int input_width = 300;
    int input_height = 300;
    double scale = 1.0 / 127.5;
    double mean = 127.5;
    int queue_size = 2;             // pending submissions before frames are dropped
};

struct TargetConfig {
    CenterZone zone;
    std::vector<std::string> classes;  // empty: any class halts
};

struct ServoConfig {
    bool enabled = true;
    std::string chip = "/sys/class/pwm/pwmchip0";
    unsigned int channel = 0;
    int min_pulse_us = 500;
    int max_pulse_us = 2500;
    double step = 2.0;             // degrees per tick
    int settle_ms = 30;
    double start_angle = 0.0;
    int max_write_failures = 10;   // consecutive, then fatal
};

struct ReconcilerConfig {
    size_t pending_capacity = 16;  // 0 = unbounded
    DrainPolicy policy = DrainPolicy::KEEP_OLDEST;
    int fps_avg_frame_count = 10;
};

struct OverlayConfig {
    bool show_window = true;
    std::string window_name = "sentry";
    // BGR
    std::array<int, 3> box_color{{0, 255, 0}};
    std::array<int, 3> target_color{{0, 0, 255}};
    std::array<int, 3> zone_color{{255, 255, 0}};
    std::array<int, 3> text_color{{255, 255, 255}};
    std::array<int, 3> warning_color{{0, 0, 255}};
};

struct LoggingConfig {
    Logger::Level level = Logger::INFO;
    int status_interval_ms = 1000;
};

struct SentryConfig {
    CameraConfig camera;
    PreprocessConfig preprocess;
    DetectorConfig detector;
    TargetConfig target;
    ServoConfig servo;
    ReconcilerConfig reconciler;
    OverlayConfig overlay;
    LoggingConfig logging;
};

// Result of command-line parsing; values land in `overrides` using the same
// layout as the YAML file so they can be merged over it.
struct CommandLine {
    std::string config_file = "config/config.yaml";
    bool help = false;
    YAML::Node overrides{YAML::NodeType::Map};
};

CommandLine parseArgs(int argc, char* argv[]);
std::string usage(const std::string& program);

// Recursively copies every scalar of `overrides` over `base`
YAML::Node mergeNodes(const YAML::Node& base, const YAML::Node& overrides);

// Missing keys keep their defaults; bad types throw YAML::Exception
SentryConfig loadConfig(const YAML::Node& root);

// Throws std::invalid_argument naming the offending key
void validate(const SentryConfig& cfg);

} // namespace sentry

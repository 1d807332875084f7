// config.cpp
#include "config.hpp"
#include <getopt.h>
#include <sstream>
#include <stdexcept>

namespace sentry {

namespace {

template <typename T>
void read(const YAML::Node& node, const char* key, T& value) {
    if (node[key]) {
        value = node[key].as<T>();
    }
}

void readColor(const YAML::Node& colors, const char* key, std::array<int, 3>& color) {
    if (!colors[key]) return;
    auto c = colors[key].as<std::vector<int>>();
    if (c.size() != 3) {
        throw std::invalid_argument(std::string("overlay.colors.") + key +
                                    " must have 3 components (B, G, R)");
    }
    color = {{c[0], c[1], c[2]}};
}

YAML::Node section(const YAML::Node& root, const char* key) {
    if (root && root.IsMap() && root[key]) {
        return root[key];
    }
    return YAML::Node();
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

void require(bool condition, const std::string& message) {
    if (!condition) throw std::invalid_argument(message);
}

} // namespace

FlipMode parseFlipMode(const std::string& name) {
    if (name == "none") return FlipMode::NONE;
    if (name == "horizontal") return FlipMode::HORIZONTAL;
    if (name == "vertical") return FlipMode::VERTICAL;
    if (name == "both") return FlipMode::BOTH;
    throw std::invalid_argument("Unknown flip mode: " + name +
                                " (expected none|horizontal|vertical|both)");
}

CommandLine parseArgs(int argc, char* argv[]) {
    CommandLine cl;
    YAML::Node& o = cl.overrides;

    static struct option long_options[] = {
        {"model", required_argument, 0, 'm'},
        {"labels", required_argument, 0, 'L'},
        {"max-results", required_argument, 0, 'r'},
        {"score-threshold", required_argument, 0, 't'},
        {"camera", required_argument, 0, 'i'},
        {"width", required_argument, 0, 'w'},
        {"height", required_argument, 0, 'h'},
        {"zone-min", required_argument, 0, 'z'},
        {"zone-max", required_argument, 0, 'Z'},
        {"classes", required_argument, 0, 'k'},
        {"step", required_argument, 0, 's'},
        {"settle-ms", required_argument, 0, 'd'},
        {"fps-window", required_argument, 0, 'f'},
        {"config", required_argument, 0, 'c'},
        {"no-window", no_argument, 0, 'n'},
        {"no-servo", no_argument, 0, 'S'},
        {"log-level", required_argument, 0, 'l'},
        {"help", no_argument, 0, 'H'},
        {0, 0, 0, 0}
    };

    // getopt keeps global state; 0 forces a full rescan
    optind = 0;
    opterr = 0;

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "m:r:t:i:w:h:s:d:f:c:nl:",
                              long_options, &option_index)) != -1) {
        switch (opt) {
            case 'm': o["detector"]["model_path"] = optarg; break;
            case 'L': o["detector"]["labels_path"] = optarg; break;
            case 'r': o["detector"]["max_results"] = optarg; break;
            case 't': o["detector"]["score_threshold"] = optarg; break;
            case 'i': o["camera"]["index"] = optarg; break;
            case 'w': o["camera"]["width"] = optarg; break;
            case 'h': o["camera"]["height"] = optarg; break;
            case 'z':
                o["target"]["zone"]["x_min"] = optarg;
                o["target"]["zone"]["y_min"] = optarg;
                break;
            case 'Z':
                o["target"]["zone"]["x_max"] = optarg;
                o["target"]["zone"]["y_max"] = optarg;
                break;
            case 'k': {
                YAML::Node classes(YAML::NodeType::Sequence);
                for (const auto& name : splitList(optarg)) {
                    classes.push_back(name);
                }
                o["target"]["classes"] = classes;
                break;
            }
            case 's': o["servo"]["step"] = optarg; break;
            case 'd': o["servo"]["settle_ms"] = optarg; break;
            case 'f': o["reconciler"]["fps_avg_frame_count"] = optarg; break;
            case 'c': cl.config_file = optarg; break;
            case 'n': o["overlay"]["show_window"] = false; break;
            case 'S': o["servo"]["enabled"] = false; break;
            case 'l': o["logging"]["level"] = optarg; break;
            case 'H': cl.help = true; break;
            default: {
                std::string arg = (optind > 0 && optind <= argc) ? argv[optind - 1] : "?";
                throw std::invalid_argument("Unknown or incomplete option: " + arg);
            }
        }
    }

    if (optind < argc) {
        throw std::invalid_argument(std::string("Unexpected argument: ") + argv[optind]);
    }
    return cl;
}

std::string usage(const std::string& program) {
    std::ostringstream ss;
    ss << "Usage: " << program << " [options]\n"
       << "Options:\n"
       << "  -m, --model PATH          Detection model (default: models/ssd_mobilenet_v2.pb)\n"
       << "      --labels PATH         Label file, one class name per line\n"
       << "  -r, --max-results N       Max detections per result (default: 3)\n"
       << "  -t, --score-threshold S   Minimum detection score (default: 0.25)\n"
       << "  -i, --camera INDEX        Camera index (default: 0)\n"
       << "  -w, --width WIDTH         Frame width (default: 640)\n"
       << "  -h, --height HEIGHT       Frame height (default: 480)\n"
       << "      --zone-min F          Center zone lower bound, both axes (default: 0.4)\n"
       << "      --zone-max F          Center zone upper bound, both axes (default: 0.6)\n"
       << "      --classes A,B         Only these classes halt the sweep (default: any)\n"
       << "  -s, --step DEG            Sweep step in degrees (default: 2)\n"
       << "  -d, --settle-ms MS        Delay after each servo write (default: 30)\n"
       << "  -f, --fps-window N        Callbacks per FPS estimate (default: 10)\n"
       << "  -c, --config FILE         Config file path (default: config/config.yaml)\n"
       << "  -n, --no-window           Disable display window\n"
       << "      --no-servo            Use a simulated servo\n"
       << "  -l, --log-level LEVEL     debug|info|warning|error (default: info)\n"
       << "      --help                Show this help\n"
       << "Keys: q/ESC quit, r reset sweep, p pause\n";
    return ss.str();
}

YAML::Node mergeNodes(const YAML::Node& base, const YAML::Node& overrides) {
    if (!overrides) {
        return base ? YAML::Clone(base) : YAML::Node();
    }
    if (!overrides.IsMap()) {
        return YAML::Clone(overrides);
    }

    YAML::Node merged = (base && base.IsMap()) ? YAML::Clone(base)
                                               : YAML::Node(YAML::NodeType::Map);
    for (const auto& kv : overrides) {
        const std::string key = kv.first.as<std::string>();
        YAML::Node existing = merged[key] ? merged[key] : YAML::Node();
        merged[key] = mergeNodes(existing, kv.second);
    }
    return merged;
}

SentryConfig loadConfig(const YAML::Node& root) {
    SentryConfig cfg;

    const YAML::Node camera = section(root, "camera");
    read(camera, "index", cfg.camera.index);
    read(camera, "width", cfg.camera.width);
    read(camera, "height", cfg.camera.height);
    read(camera, "fps", cfg.camera.fps);
    read(camera, "backend", cfg.camera.backend);
    read(camera, "pipeline", cfg.camera.pipeline);
    read(camera, "max_consecutive_failures", cfg.camera.max_consecutive_failures);

    const YAML::Node preprocess = section(root, "preprocess");
    if (preprocess["flip"]) {
        cfg.preprocess.flip = parseFlipMode(preprocess["flip"].as<std::string>());
    }
    read(preprocess, "to_rgb", cfg.preprocess.to_rgb);

    const YAML::Node detector = section(root, "detector");
    read(detector, "model_path", cfg.detector.model_path);
    read(detector, "config_path", cfg.detector.config_path);
    read(detector, "labels_path", cfg.detector.labels_path);
    read(detector, "max_results", cfg.detector.max_results);
    read(detector, "score_threshold", cfg.detector.score_threshold);
    read(detector, "input_width", cfg.detector.input_width);
    read(detector, "input_height", cfg.detector.input_height);
    read(detector, "scale", cfg.detector.scale);
    read(detector, "mean", cfg.detector.mean);
    read(detector, "queue_size", cfg.detector.queue_size);

    const YAML::Node target = section(root, "target");
    const YAML::Node zone = section(target, "zone");
    read(zone, "x_min", cfg.target.zone.x_min);
    read(zone, "x_max", cfg.target.zone.x_max);
    read(zone, "y_min", cfg.target.zone.y_min);
    read(zone, "y_max", cfg.target.zone.y_max);
    read(target, "classes", cfg.target.classes);

    const YAML::Node servo = section(root, "servo");
    read(servo, "enabled", cfg.servo.enabled);
    read(servo, "chip", cfg.servo.chip);
    read(servo, "channel", cfg.servo.channel);
    read(servo, "min_pulse_us", cfg.servo.min_pulse_us);
    read(servo, "max_pulse_us", cfg.servo.max_pulse_us);
    read(servo, "step", cfg.servo.step);
    read(servo, "settle_ms", cfg.servo.settle_ms);
    read(servo, "start_angle", cfg.servo.start_angle);
    read(servo, "max_write_failures", cfg.servo.max_write_failures);

    const YAML::Node reconciler = section(root, "reconciler");
    read(reconciler, "pending_capacity", cfg.reconciler.pending_capacity);
    if (reconciler["policy"]) {
        cfg.reconciler.policy = parseDrainPolicy(reconciler["policy"].as<std::string>());
    }
    read(reconciler, "fps_avg_frame_count", cfg.reconciler.fps_avg_frame_count);

    const YAML::Node overlay = section(root, "overlay");
    read(overlay, "show_window", cfg.overlay.show_window);
    read(overlay, "window_name", cfg.overlay.window_name);
    const YAML::Node colors = section(overlay, "colors");
    readColor(colors, "box", cfg.overlay.box_color);
    readColor(colors, "target", cfg.overlay.target_color);
    readColor(colors, "zone", cfg.overlay.zone_color);
    readColor(colors, "text", cfg.overlay.text_color);
    readColor(colors, "warning", cfg.overlay.warning_color);

    const YAML::Node logging = section(root, "logging");
    if (logging["level"]) {
        cfg.logging.level = Logger::parseLevel(logging["level"].as<std::string>());
    }
    read(logging, "status_interval_ms", cfg.logging.status_interval_ms);

    return cfg;
}

void validate(const SentryConfig& cfg) {
    require(cfg.camera.width > 0 && cfg.camera.height > 0,
            "camera.width and camera.height must be positive");
    require(cfg.camera.fps > 0, "camera.fps must be positive");
    require(cfg.camera.backend == "v4l2" || cfg.camera.backend == "gstreamer" ||
            cfg.camera.backend == "any",
            "camera.backend must be v4l2, gstreamer or any");
    require(cfg.camera.max_consecutive_failures > 0,
            "camera.max_consecutive_failures must be positive");

    require(!cfg.detector.model_path.empty(), "detector.model_path is required");
    require(cfg.detector.max_results > 0, "detector.max_results must be positive");
    require(cfg.detector.score_threshold >= 0.0f && cfg.detector.score_threshold <= 1.0f,
            "detector.score_threshold must be in [0, 1]");
    require(cfg.detector.input_width > 0 && cfg.detector.input_height > 0,
            "detector.input_width and detector.input_height must be positive");
    require(cfg.detector.queue_size > 0, "detector.queue_size must be positive");

    const CenterZone& z = cfg.target.zone;
    require(z.x_min >= 0.0 && z.x_min <= z.x_max && z.x_max <= 1.0,
            "target.zone x bounds must satisfy 0 <= x_min <= x_max <= 1");
    require(z.y_min >= 0.0 && z.y_min <= z.y_max && z.y_max <= 1.0,
            "target.zone y bounds must satisfy 0 <= y_min <= y_max <= 1");

    require(cfg.servo.step > 0.0 && cfg.servo.step <= 180.0, "servo.step must be in (0, 180]");
    require(cfg.servo.settle_ms >= 0, "servo.settle_ms must not be negative");
    require(cfg.servo.start_angle >= 0.0 && cfg.servo.start_angle <= 180.0,
            "servo.start_angle must be in [0, 180]");
    require(cfg.servo.min_pulse_us > 0 && cfg.servo.min_pulse_us < cfg.servo.max_pulse_us,
            "servo pulse range must satisfy 0 < min_pulse_us < max_pulse_us");
    require(cfg.servo.max_write_failures > 0, "servo.max_write_failures must be positive");

    require(cfg.reconciler.fps_avg_frame_count > 0,
            "reconciler.fps_avg_frame_count must be positive");
    require(cfg.logging.status_interval_ms >= 0,
            "logging.status_interval_ms must not be negative");
}

} // namespace sentry

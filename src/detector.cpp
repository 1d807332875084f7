// detector.cpp
#include "detector.hpp"
#include "utils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace sentry {

DnnInferenceEngine::DnnInferenceEngine(const DetectorConfig& config)
    : config_(config) {}

bool DnnInferenceEngine::loadLabels(const std::string& path, std::vector<std::string>& labels) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    labels.clear();
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        labels.push_back(line);
    }
    return true;
}

bool DnnInferenceEngine::initialize() {
    if (!config_.labels_path.empty() && !loadLabels(config_.labels_path, labels_)) {
        last_error_ = "Could not read labels file: " + config_.labels_path;
        return false;
    }

    try {
        net_ = cv::dnn::readNet(config_.model_path, config_.config_path);
    } catch (const cv::Exception& e) {
        last_error_ = "Could not load model " + config_.model_path + ": " + e.what();
        return false;
    }

    if (net_.empty()) {
        last_error_ = "Could not load model " + config_.model_path;
        return false;
    }

    net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
    net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);

    // Run once so an unsupported output layout fails at startup
    try {
        cv::Mat blank(config_.input_height, config_.input_width, CV_8UC3, cv::Scalar::all(0));
        cv::dnn::blobFromImage(blank, blob_, config_.scale,
                               cv::Size(config_.input_width, config_.input_height),
                               cv::Scalar::all(config_.mean), false, false);
        net_.setInput(blob_);
        cv::Mat out = net_.forward();
        if (out.dims != 4 || out.size[3] != 7) {
            std::ostringstream ss;
            ss << "Unsupported model output layout (dims=" << out.dims
               << "), expected [1, 1, N, 7] detection output";
            last_error_ = ss.str();
            return false;
        }
    } catch (const cv::Exception& e) {
        last_error_ = std::string("Startup inference failed: ") + e.what();
        return false;
    }

    loaded_ = true;

    std::ostringstream ss;
    ss << "Detector ready: " << config_.model_path
       << " (" << config_.input_width << "x" << config_.input_height
       << ", " << labels_.size() << " labels)";
    Logger::log(Logger::INFO, ss.str());
    return true;
}

std::string DnnInferenceEngine::labelFor(int class_id) const {
    if (class_id >= 0 && static_cast<size_t>(class_id) < labels_.size() &&
        !labels_[class_id].empty()) {
        return labels_[class_id];
    }
    return "class_" + std::to_string(class_id);
}

std::vector<Detection> DnnInferenceEngine::parseDetections(const cv::Mat& output,
                                                           int frame_width,
                                                           int frame_height) const {
    std::vector<Detection> detections;
    if (output.dims != 4 || output.size[3] != 7) {
        return detections;
    }

    cv::Mat rows(output.size[2], output.size[3], CV_32F,
                 const_cast<float*>(output.ptr<float>()));

    for (int i = 0; i < rows.rows; i++) {
        const float* r = rows.ptr<float>(i);
        float score = r[2];
        if (score < config_.score_threshold) continue;

        float x1 = std::max(0.0f, std::min(1.0f, r[3])) * frame_width;
        float y1 = std::max(0.0f, std::min(1.0f, r[4])) * frame_height;
        float x2 = std::max(0.0f, std::min(1.0f, r[5])) * frame_width;
        float y2 = std::max(0.0f, std::min(1.0f, r[6])) * frame_height;
        if (x2 <= x1 || y2 <= y1) continue;

        Detection d;
        d.box.x = x1;
        d.box.y = y1;
        d.box.width = x2 - x1;
        d.box.height = y2 - y1;

        Category c;
        c.index = static_cast<int>(r[1]);
        c.name = labelFor(c.index);
        c.score = score;
        d.categories.push_back(c);

        detections.push_back(d);
    }

    return filterDetections(std::move(detections), config_.score_threshold,
                            config_.max_results);
}

std::vector<Detection> DnnInferenceEngine::infer(const cv::Mat& frame) {
    if (!loaded_) {
        throw std::runtime_error("inference engine not initialized");
    }

    cv::dnn::blobFromImage(frame, blob_, config_.scale,
                           cv::Size(config_.input_width, config_.input_height),
                           cv::Scalar::all(config_.mean), false, false);
    net_.setInput(blob_);
    cv::Mat out = net_.forward();

    return parseDetections(out, frame.cols, frame.rows);
}

} // namespace sentry

#include "DetectionConfiguration.hpp"

#include <shared/utils/Logger.hpp>
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace OverlayCut::Internal::Config {

namespace {

double parseDouble(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("parameter " + key + ": '" + value + "' is not a number");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("parameter " + key + ": trailing characters in '" + value + "'");
    }
    return parsed;
}

int parseInt(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("parameter " + key + ": '" + value + "' is not an integer");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument("parameter " + key + ": trailing characters in '" + value + "'");
    }
    return parsed;
}

std::vector<double> parseList(const std::string& key, const std::string& value) {
    std::vector<double> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        items.push_back(parseDouble(key, item));
    }
    if (items.size() != 3) {
        throw std::invalid_argument("parameter " + key + ": expected three comma-separated values");
    }
    return items;
}

Types::HsvTriple parseTriple(const std::string& key, const std::string& value) {
    const auto items = parseList(key, value);
    return {items[0], items[1], items[2]};
}

Types::Rgb toRgb(const std::string& key, const std::vector<double>& items) {
    if (items.size() != 3) {
        throw std::invalid_argument("parameter " + key + ": expected three color channels");
    }
    for (double channel : items) {
        if (channel < 0.0 || channel > 255.0) {
            throw std::invalid_argument("parameter " + key + ": channel out of range 0..255");
        }
    }
    return {static_cast<std::uint8_t>(items[0]), static_cast<std::uint8_t>(items[1]),
            static_cast<std::uint8_t>(items[2])};
}

std::string formatNumber(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::string formatTriple(const Types::HsvTriple& triple) {
    return formatNumber(triple[0]) + "," + formatNumber(triple[1]) + "," + formatNumber(triple[2]);
}

std::string formatRgb(const Types::Rgb& rgb) {
    return std::to_string(rgb.r) + "," + std::to_string(rgb.g) + "," + std::to_string(rgb.b);
}

void readTriple(const cv::FileNode& node, Types::HsvTriple& out) {
    if (node.empty()) return;
    std::vector<double> items;
    node >> items;
    if (items.size() != 3) {
        throw std::invalid_argument("configuration entry " + node.name() + " needs three values");
    }
    out = Types::HsvTriple(items[0], items[1], items[2]);
}

void readRgb(const cv::FileNode& node, Types::Rgb& out) {
    if (node.empty()) return;
    std::vector<double> items;
    node >> items;
    out = toRgb(node.name(), items);
}

template <typename T>
void readScalar(const cv::FileNode& node, T& out) {
    if (node.empty()) return;
    node >> out;
}

}  // namespace

DetectionConfiguration::DetectionConfiguration() {
    reset();
}

Types::Rgb DetectionConfiguration::getBackgroundColor() const { return backgroundColor_; }
void DetectionConfiguration::setBackgroundColor(const Types::Rgb& color) { backgroundColor_ = color; }
Types::HsvTriple DetectionConfiguration::getBackgroundTolerance() const { return backgroundTolerance_; }
void DetectionConfiguration::setBackgroundTolerance(const Types::HsvTriple& tolerance) {
    backgroundTolerance_ = tolerance;
}

Types::Rgb DetectionConfiguration::getAccentColor() const { return accentColor_; }
void DetectionConfiguration::setAccentColor(const Types::Rgb& color) { accentColor_ = color; }
Types::HsvTriple DetectionConfiguration::getAccentTolerance() const { return accentTolerance_; }
void DetectionConfiguration::setAccentTolerance(const Types::HsvTriple& tolerance) {
    accentTolerance_ = tolerance;
}

Types::HsvTriple DetectionConfiguration::getTextLower() const { return textLower_; }
Types::HsvTriple DetectionConfiguration::getTextUpper() const { return textUpper_; }
void DetectionConfiguration::setTextRange(const Types::HsvTriple& lower, const Types::HsvTriple& upper) {
    textLower_ = lower;
    textUpper_ = upper;
}

double DetectionConfiguration::getMinCalibrationAreaRatio() const { return minCalibrationAreaRatio_; }
void DetectionConfiguration::setMinCalibrationAreaRatio(double ratio) { minCalibrationAreaRatio_ = ratio; }
double DetectionConfiguration::getMinIoU() const { return minIoU_; }
void DetectionConfiguration::setMinIoU(double iou) { minIoU_ = iou; }
double DetectionConfiguration::getMinAccentRatio() const { return minAccentRatio_; }
void DetectionConfiguration::setMinAccentRatio(double ratio) { minAccentRatio_ = ratio; }
double DetectionConfiguration::getMinTextRatio() const { return minTextRatio_; }
void DetectionConfiguration::setMinTextRatio(double ratio) { minTextRatio_ = ratio; }

Types::Seconds DetectionConfiguration::getClusterTolerance() const { return clusterTolerance_; }
void DetectionConfiguration::setClusterTolerance(Types::Seconds tolerance) { clusterTolerance_ = tolerance; }
Types::Seconds DetectionConfiguration::getMinSegment() const { return minSegment_; }
void DetectionConfiguration::setMinSegment(Types::Seconds minSegment) { minSegment_ = minSegment; }

int DetectionConfiguration::getProcessingWidth() const { return processingWidth_; }
void DetectionConfiguration::setProcessingWidth(int width) { processingWidth_ = width; }
int DetectionConfiguration::getFrameStep() const { return frameStep_; }
void DetectionConfiguration::setFrameStep(int step) { frameStep_ = step; }
int DetectionConfiguration::getProgressInterval() const { return progressInterval_; }
void DetectionConfiguration::setProgressInterval(int frames) { progressInterval_ = frames; }
int DetectionConfiguration::getThreadCount() const { return threadCount_; }
void DetectionConfiguration::setThreadCount(int count) { threadCount_ = count; }

bool DetectionConfiguration::loadFromFile(const std::string& filename) {
    try {
        cv::FileStorage fs(filename, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            LOG_ERROR("Cannot open configuration file for reading: ", filename);
            return false;
        }

        DetectionConfiguration staged(*this);
        staged.read(fs.root());
        staged.validate();
        *this = staged;

        LOG_INFO("Configuration loaded from: ", filename);
        return true;

    } catch (const cv::Exception& e) {
        LOG_ERROR("OpenCV error loading configuration ", filename, ": ", e.what());
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid configuration in ", filename, ": ", e.what());
    }
    return false;
}

bool DetectionConfiguration::saveToFile(const std::string& filename) const {
    try {
        cv::FileStorage fs(filename, cv::FileStorage::WRITE);
        if (!fs.isOpened()) {
            LOG_ERROR("Cannot open configuration file for writing: ", filename);
            return false;
        }
        write(fs);
        fs.release();
        LOG_INFO("Configuration saved to: ", filename);
        return true;

    } catch (const cv::Exception& e) {
        LOG_ERROR("OpenCV error saving configuration ", filename, ": ", e.what());
        return false;
    }
}

bool DetectionConfiguration::loadFromString(const std::string& configString) {
    try {
        cv::FileStorage fs(configString, cv::FileStorage::READ | cv::FileStorage::MEMORY);
        if (!fs.isOpened()) {
            LOG_ERROR("Configuration string could not be parsed");
            return false;
        }

        DetectionConfiguration staged(*this);
        staged.read(fs.root());
        staged.validate();
        *this = staged;
        return true;

    } catch (const cv::Exception& e) {
        LOG_ERROR("OpenCV error parsing configuration string: ", e.what());
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid configuration string: ", e.what());
    }
    return false;
}

std::string DetectionConfiguration::saveToString() const {
    cv::FileStorage fs(".yml", cv::FileStorage::WRITE | cv::FileStorage::MEMORY);
    write(fs);
    return fs.releaseAndGetString();
}

void DetectionConfiguration::setParameter(const std::string& key, const std::string& value) {
    if (key == "background_color") {
        backgroundColor_ = toRgb(key, parseList(key, value));
    } else if (key == "background_tolerance") {
        backgroundTolerance_ = parseTriple(key, value);
    } else if (key == "accent_color") {
        accentColor_ = toRgb(key, parseList(key, value));
    } else if (key == "accent_tolerance") {
        accentTolerance_ = parseTriple(key, value);
    } else if (key == "text_lower") {
        textLower_ = parseTriple(key, value);
    } else if (key == "text_upper") {
        textUpper_ = parseTriple(key, value);
    } else if (key == "min_calibration_area_ratio") {
        minCalibrationAreaRatio_ = parseDouble(key, value);
    } else if (key == "min_iou") {
        minIoU_ = parseDouble(key, value);
    } else if (key == "min_accent_ratio") {
        minAccentRatio_ = parseDouble(key, value);
    } else if (key == "min_text_ratio") {
        minTextRatio_ = parseDouble(key, value);
    } else if (key == "cluster_tolerance") {
        clusterTolerance_ = parseDouble(key, value);
    } else if (key == "min_segment") {
        minSegment_ = parseDouble(key, value);
    } else if (key == "processing_width") {
        processingWidth_ = parseInt(key, value);
    } else if (key == "frame_step") {
        frameStep_ = parseInt(key, value);
    } else if (key == "progress_interval") {
        progressInterval_ = parseInt(key, value);
    } else if (key == "thread_count") {
        threadCount_ = parseInt(key, value);
    } else {
        throw std::invalid_argument("unknown configuration parameter: " + key);
    }
}

std::string DetectionConfiguration::getParameter(const std::string& key) const {
    const auto all = getAllParameters();
    const auto it = all.find(key);
    return it == all.end() ? std::string() : it->second;
}

std::map<std::string, std::string> DetectionConfiguration::getAllParameters() const {
    return {
        {"background_color", formatRgb(backgroundColor_)},
        {"background_tolerance", formatTriple(backgroundTolerance_)},
        {"accent_color", formatRgb(accentColor_)},
        {"accent_tolerance", formatTriple(accentTolerance_)},
        {"text_lower", formatTriple(textLower_)},
        {"text_upper", formatTriple(textUpper_)},
        {"min_calibration_area_ratio", formatNumber(minCalibrationAreaRatio_)},
        {"min_iou", formatNumber(minIoU_)},
        {"min_accent_ratio", formatNumber(minAccentRatio_)},
        {"min_text_ratio", formatNumber(minTextRatio_)},
        {"cluster_tolerance", formatNumber(clusterTolerance_)},
        {"min_segment", formatNumber(minSegment_)},
        {"processing_width", std::to_string(processingWidth_)},
        {"frame_step", std::to_string(frameStep_)},
        {"progress_interval", std::to_string(progressInterval_)},
        {"thread_count", std::to_string(threadCount_)},
    };
}

bool DetectionConfiguration::isValid() const {
    for (int i = 0; i < 3; ++i) {
        if (backgroundTolerance_[i] < 0.0 || accentTolerance_[i] < 0.0) return false;
        if (textLower_[i] > textUpper_[i]) return false;
    }
    return minCalibrationAreaRatio_ >= 0.0 && minCalibrationAreaRatio_ < 1.0 &&
           minIoU_ >= 0.0 && minIoU_ <= 1.0 &&
           minAccentRatio_ >= 0.0 && minAccentRatio_ < 1.0 &&
           minTextRatio_ >= 0.0 && minTextRatio_ < 1.0 &&
           clusterTolerance_ >= 0.0 && minSegment_ >= 0.0 &&
           processingWidth_ >= 0 && frameStep_ >= 1 && progressInterval_ >= 1 && threadCount_ >= 0;
}

void DetectionConfiguration::reset() {
    const Calibration::ReferenceCalibrator::CalibrationSettings calibration;
    const Detection::FrameScanner::ScannerSettings scanner;
    const Timeline::TimelineSegmenter::SegmenterSettings segmenter;

    backgroundColor_ = calibration.backgroundColor;
    backgroundTolerance_ = calibration.backgroundTolerance;
    accentColor_ = calibration.accentColor;
    accentTolerance_ = calibration.accentTolerance;
    textLower_ = calibration.textLower;
    textUpper_ = calibration.textUpper;
    minCalibrationAreaRatio_ = calibration.minAreaRatio;
    minIoU_ = scanner.minIoU;
    minAccentRatio_ = scanner.minAccentRatio;
    minTextRatio_ = scanner.minTextRatio;
    clusterTolerance_ = segmenter.clusterTolerance;
    minSegment_ = segmenter.minSegment;
    processingWidth_ = 640;
    frameStep_ = 1;
    progressInterval_ = 30;
    threadCount_ = 1;
}

void DetectionConfiguration::validate() {
    if (isValid()) return;

    LOG_WARN("Configuration contains out-of-range values; clamping");
    for (int i = 0; i < 3; ++i) {
        backgroundTolerance_[i] = std::max(0.0, backgroundTolerance_[i]);
        accentTolerance_[i] = std::max(0.0, accentTolerance_[i]);
        if (textLower_[i] > textUpper_[i]) std::swap(textLower_[i], textUpper_[i]);
    }
    minCalibrationAreaRatio_ = std::clamp(minCalibrationAreaRatio_, 0.0, 0.99);
    minIoU_ = std::clamp(minIoU_, 0.0, 1.0);
    minAccentRatio_ = std::clamp(minAccentRatio_, 0.0, 0.99);
    minTextRatio_ = std::clamp(minTextRatio_, 0.0, 0.99);
    clusterTolerance_ = std::max(0.0, clusterTolerance_);
    minSegment_ = std::max(0.0, minSegment_);
    processingWidth_ = std::max(0, processingWidth_);
    frameStep_ = std::max(1, frameStep_);
    progressInterval_ = std::max(1, progressInterval_);
    threadCount_ = std::max(0, threadCount_);
}

void DetectionConfiguration::write(cv::FileStorage& fs) const {
    fs << "detection" << "{";
    fs << "background_color"
       << std::vector<int>{backgroundColor_.r, backgroundColor_.g, backgroundColor_.b};
    fs << "background_tolerance"
       << std::vector<double>{backgroundTolerance_[0], backgroundTolerance_[1], backgroundTolerance_[2]};
    fs << "accent_color" << std::vector<int>{accentColor_.r, accentColor_.g, accentColor_.b};
    fs << "accent_tolerance"
       << std::vector<double>{accentTolerance_[0], accentTolerance_[1], accentTolerance_[2]};
    fs << "text_lower" << std::vector<double>{textLower_[0], textLower_[1], textLower_[2]};
    fs << "text_upper" << std::vector<double>{textUpper_[0], textUpper_[1], textUpper_[2]};
    fs << "min_calibration_area_ratio" << minCalibrationAreaRatio_;
    fs << "min_iou" << minIoU_;
    fs << "min_accent_ratio" << minAccentRatio_;
    fs << "min_text_ratio" << minTextRatio_;
    fs << "}";

    fs << "timeline" << "{";
    fs << "cluster_tolerance" << clusterTolerance_;
    fs << "min_segment" << minSegment_;
    fs << "}";

    fs << "sampling" << "{";
    fs << "processing_width" << processingWidth_;
    fs << "frame_step" << frameStep_;
    fs << "progress_interval" << progressInterval_;
    fs << "thread_count" << threadCount_;
    fs << "}";
}

void DetectionConfiguration::read(const cv::FileNode& root) {
    const cv::FileNode detection = root["detection"];
    if (!detection.empty()) {
        readRgb(detection["background_color"], backgroundColor_);
        readTriple(detection["background_tolerance"], backgroundTolerance_);
        readRgb(detection["accent_color"], accentColor_);
        readTriple(detection["accent_tolerance"], accentTolerance_);
        readTriple(detection["text_lower"], textLower_);
        readTriple(detection["text_upper"], textUpper_);
        readScalar(detection["min_calibration_area_ratio"], minCalibrationAreaRatio_);
        readScalar(detection["min_iou"], minIoU_);
        readScalar(detection["min_accent_ratio"], minAccentRatio_);
        readScalar(detection["min_text_ratio"], minTextRatio_);
    }

    const cv::FileNode timeline = root["timeline"];
    if (!timeline.empty()) {
        readScalar(timeline["cluster_tolerance"], clusterTolerance_);
        readScalar(timeline["min_segment"], minSegment_);
    }

    const cv::FileNode sampling = root["sampling"];
    if (!sampling.empty()) {
        readScalar(sampling["processing_width"], processingWidth_);
        readScalar(sampling["frame_step"], frameStep_);
        readScalar(sampling["progress_interval"], progressInterval_);
        readScalar(sampling["thread_count"], threadCount_);
    }
}

}  // namespace OverlayCut::Internal::Config

namespace OverlayCut::Interface {

std::unique_ptr<IConfiguration> createDefaultConfiguration() {
    return std::make_unique<Internal::Config::DetectionConfiguration>();
}

}  // namespace OverlayCut::Interface

#include "ReferenceCalibrator.hpp"

#include "../processing/ColorSegmenter.hpp"
#include "../processing/ColorSpaceConverter.hpp"
#include <opencv2/core.hpp>
#include <algorithm>

namespace OverlayCut::Internal::Calibration {

ReferenceCalibrator::CalibrationSettings::CalibrationSettings()
    : backgroundColor{14, 4, 49},
      backgroundTolerance(20.0, 50.0, 50.0),
      accentColor{50, 4, 139},
      accentTolerance(15.0, 50.0, 50.0),
      textLower(0.0, 0.0, 200.0),
      textUpper(180.0, 30.0, 255.0),
      minAreaRatio(0.01) {}

Domain::ColorRange ReferenceCalibrator::CalibrationSettings::backgroundRange() const {
    return Processing::ColorSpaceConverter::rangeFromColor(
        backgroundColor, backgroundTolerance[0], backgroundTolerance[1], backgroundTolerance[2]);
}

Domain::ColorRange ReferenceCalibrator::CalibrationSettings::accentRange() const {
    return Processing::ColorSpaceConverter::rangeFromColor(
        accentColor, accentTolerance[0], accentTolerance[1], accentTolerance[2]);
}

Domain::ColorRange ReferenceCalibrator::CalibrationSettings::textRange() const {
    return Domain::ColorRange::fromBounds(textLower, textUpper);
}

ReferenceCalibrator::ReferenceCalibrator(const CalibrationSettings& settings)
    : settings_(settings) {
    LOG_DEBUG("Reference calibrator initialized");
}

Domain::VisionProfile ReferenceCalibrator::calibrate(const Types::Image& referenceImage) const {
    if (referenceImage.empty()) {
        throw Domain::CalibrationError("no menu detected: reference image is empty");
    }

    LOG_INFO("Calibrating from ", referenceImage.cols, "x", referenceImage.rows,
             " reference image");

    const Domain::ColorRange background = settings_.backgroundRange();
    const Domain::ColorRange accent = settings_.accentRange();
    const Domain::ColorRange text = settings_.textRange();

    Types::Image hsv;
    try {
        hsv = Processing::ColorSpaceConverter::toHsv(referenceImage);
    } catch (const Domain::FrameScanError& e) {
        throw Domain::CalibrationError(std::string("no menu detected: ") + e.what());
    }

    std::vector<Processing::Blob> blobs;
    try {
        blobs = Processing::ColorSegmenter::segment(hsv, background);
    } catch (const cv::Exception& e) {
        LOG_ERROR("OpenCV exception during calibration: ", e.what());
        throw Domain::CalibrationError(std::string("no menu detected: ") + e.what());
    }

    const auto best = std::max_element(
        blobs.begin(), blobs.end(),
        [](const Processing::Blob& a, const Processing::Blob& b) { return a.area < b.area; });

    const double totalPixels = static_cast<double>(referenceImage.cols) * referenceImage.rows;
    const double minArea = totalPixels * settings_.minAreaRatio;

    if (best == blobs.end() || best->area <= minArea) {
        LOG_ERROR("Calibration failed. Max area: ", best == blobs.end() ? 0.0 : best->area,
                  " (threshold: ", minArea, ")");
        throw Domain::CalibrationError("no menu detected");
    }

    const Types::Rect& box = best->boundingBox;
    LOG_INFO("Detected menu box: x=", box.x, ", y=", box.y, ", w=", box.width, ", h=", box.height);

    const Domain::SpatialTemplate spatial =
        Domain::SpatialTemplate::fromPixelBox(box, referenceImage.size());
    LOG_INFO("Normalized profile: ", spatial.toString());

    return Domain::VisionProfile(background, accent, text, spatial);
}

void ReferenceCalibrator::setSettings(const CalibrationSettings& settings) {
    settings_ = settings;
}

ReferenceCalibrator::CalibrationSettings ReferenceCalibrator::getSettings() const {
    return settings_;
}

}  // namespace OverlayCut::Internal::Calibration

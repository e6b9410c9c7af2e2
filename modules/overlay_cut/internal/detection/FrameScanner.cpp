#include "FrameScanner.hpp"

#include "SpatialMatcher.hpp"
#include "../domain/Errors.hpp"
#include "../processing/ColorSpaceConverter.hpp"
#include <opencv2/core.hpp>
#include <algorithm>
#include <stdexcept>

namespace OverlayCut::Internal::Detection {

FrameScanner::ScannerSettings::ScannerSettings()
    : minIoU(0.3), minAccentRatio(0.01), minTextRatio(0.01), debug(false) {}

FrameScanner::FrameScanner(const ScannerSettings& settings) : settings_(settings) {
    LOG_DEBUG("Frame scanner initialized (IoU >= ", settings_.minIoU, ", accent > ",
              settings_.minAccentRatio, ", text > ", settings_.minTextRatio, ")");
}

Domain::DetectionEvent FrameScanner::scan(const Domain::Frame& frame,
                                          const Domain::VisionProfile& profile,
                                          bool* faulted) const {
    if (faulted) *faulted = false;
    try {
        return scanDetailed(frame, profile, nullptr);
    } catch (const Domain::FrameScanError& e) {
        LOG_WARN("Frame ", frame.index, " at ", frame.timestamp, "s skipped: ", e.what());
    } catch (const cv::Exception& e) {
        LOG_ERROR("OpenCV exception scanning frame ", frame.index, " at ", frame.timestamp,
                  "s: ", e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Error scanning frame ", frame.index, " at ", frame.timestamp, "s: ", e.what());
    }
    if (faulted) *faulted = true;
    return Domain::DetectionEvent::miss(frame.timestamp);
}

Domain::DetectionEvent FrameScanner::scanDetailed(const Domain::Frame& frame,
                                                  const Domain::VisionProfile& profile,
                                                  std::vector<CandidateReport>* reports) const {
    if (frame.empty()) {
        throw Domain::FrameScanError("frame is empty");
    }
    if (!profile.getSpatial().isValid()) {
        throw std::invalid_argument("vision profile has no overlay box");
    }

    // Profile boxes are normalized, so the reference may differ in resolution from the video
    const Types::Rect expectedRect = profile.getSpatial().project(frame.size());

    const Types::Image hsv = Processing::ColorSpaceConverter::toHsv(frame.image);
    const std::vector<Processing::Blob> candidates =
        orderCandidates(Processing::ColorSegmenter::segment(hsv, profile.getBackground()));

    for (const auto& candidate : candidates) {
        CandidateReport report;
        report.boundingBox = candidate.boundingBox;
        report.iou = SpatialMatcher::intersectionOverUnion(candidate.boundingBox, expectedRect);
        report.spatiallyLocked =
            SpatialMatcher::isLocked(candidate.boundingBox, expectedRect, settings_.minIoU);

        if (!report.spatiallyLocked) {
            if (reports) reports->push_back(report);
            continue;
        }

        if (settings_.debug) {
            LOG_DEBUG("Spatial match: IoU ", report.iou, " at [", candidate.boundingBox.x, ", ",
                      candidate.boundingBox.y, "]");
        }

        const Types::Image roi = hsv(candidate.boundingBox);
        report.accentRatio = Processing::ColorSegmenter::matchRatio(roi, profile.getAccent());
        report.textRatio = Processing::ColorSegmenter::matchRatio(roi, profile.getText());
        report.passedTriad = report.accentRatio > settings_.minAccentRatio &&
                             report.textRatio > settings_.minTextRatio;

        if (settings_.debug) {
            LOG_DEBUG("Triad density: accent ", report.accentRatio * 100.0, "%, text ",
                      report.textRatio * 100.0, "%");
        }

        if (reports) reports->push_back(report);

        if (report.passedTriad) {
            return Domain::DetectionEvent::detected(frame.timestamp,
                                                    static_cast<float>(report.textRatio));
        }
    }

    return Domain::DetectionEvent::miss(frame.timestamp);
}

void FrameScanner::setSettings(const ScannerSettings& settings) {
    settings_ = settings;
}

FrameScanner::ScannerSettings FrameScanner::getSettings() const {
    return settings_;
}

std::vector<Processing::Blob> FrameScanner::orderCandidates(std::vector<Processing::Blob> blobs) const {
    // Largest box first; discovery order breaks ties so results do not depend on contour tracing
    std::stable_sort(blobs.begin(), blobs.end(),
                     [](const Processing::Blob& a, const Processing::Blob& b) {
                         return a.boundingBox.area() > b.boundingBox.area();
                     });
    return blobs;
}

}  // namespace OverlayCut::Internal::Detection

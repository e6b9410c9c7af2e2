#include <overlay_cut/interface/OverlayCutAPI.hpp>

#include <overlay_cut/internal/calibration/ReferenceCalibrator.hpp>
#include <overlay_cut/internal/detection/FrameScanner.hpp>
#include <overlay_cut/internal/export/FfmpegCommandBuilder.hpp>
#include <overlay_cut/internal/export/VideoRangeExporter.hpp>
#include <overlay_cut/internal/io/VideoFrameSource.hpp>
#include <overlay_cut/internal/session/ScanSession.hpp>
#include <overlay_cut/internal/timeline/TimelineSegmenter.hpp>
#include <shared/utils/Logger.hpp>
#include <opencv2/imgcodecs.hpp>
#include <stdexcept>

namespace OverlayCut {

Domain::VisionProfile calibrate(const Types::Image& referenceImage) {
    const Internal::Calibration::ReferenceCalibrator calibrator;
    return calibrator.calibrate(referenceImage);
}

Domain::DetectionEvent scan(const Domain::Frame& frame, const Domain::VisionProfile& profile) {
    const Internal::Detection::FrameScanner scanner;
    return scanner.scan(frame, profile);
}

std::vector<Domain::KeepRange> segmentTimeline(const std::vector<Domain::DetectionEvent>& events,
                                               Types::Seconds duration) {
    const Internal::Timeline::TimelineSegmenter segmenter;
    return segmenter.segment(events, duration).keepRanges;
}

namespace SimpleAPI {

bool findCleanRanges(const std::string& referenceImagePath, const std::string& videoPath,
                     std::vector<Domain::KeepRange>& keepRanges) {
    const Types::Image reference = cv::imread(referenceImagePath, cv::IMREAD_COLOR);
    if (reference.empty()) {
        LOG_ERROR("Cannot load reference image ", referenceImagePath);
        return false;
    }

    try {
        Internal::IO::VideoFrameSource source(videoPath);
        Internal::Session::ScanSession session;
        const auto result = session.run(reference, source);
        if (!result.isSuccess()) return false;

        keepRanges = result.segmentation.keepRanges;
        return true;
    } catch (const Domain::CalibrationError& e) {
        LOG_ERROR("Calibration failed for ", referenceImagePath, ": ", e.what());
    } catch (const std::runtime_error& e) {
        LOG_ERROR(e.what());
    }
    return false;
}

std::vector<std::string> buildEditCommand(const std::vector<Domain::KeepRange>& keepRanges,
                                          const std::string& outputName,
                                          const std::string& inputPath) {
    Internal::Export::FfmpegCommandBuilder::EncoderSettings encoder;
    encoder.inputName = inputPath;
    const Internal::Export::FfmpegCommandBuilder builder(encoder);
    return builder.build(keepRanges, outputName);
}

bool removeOverlay(const std::string& referenceImagePath, const std::string& videoPath,
                   const std::string& outputVideoPath) {
    std::vector<Domain::KeepRange> keepRanges;
    if (!findCleanRanges(referenceImagePath, videoPath, keepRanges)) return false;

    Internal::Export::VideoRangeExporter exporter;
    const Interface::ExportResult result =
        exporter.exportRanges(videoPath, keepRanges, outputVideoPath);
    return result.success;
}

}  // namespace SimpleAPI

}  // namespace OverlayCut

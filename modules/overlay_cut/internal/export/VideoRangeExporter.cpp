#include "VideoRangeExporter.hpp"

#include <shared/utils/Logger.hpp>
#include <opencv2/videoio.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>

namespace OverlayCut::Internal::Export {

VideoRangeExporter::ExportSettings::ExportSettings() : fourcc(0), outputFps(0.0) {}

VideoRangeExporter::VideoRangeExporter(const ExportSettings& settings) : settings_(settings) {}

Interface::ExportResult VideoRangeExporter::exportRanges(
    const std::string& sourcePath, const std::vector<Domain::KeepRange>& keepRanges,
    const std::string& outputPath) {
    const auto startTime = std::chrono::steady_clock::now();

    Interface::ExportResult result;
    result.outputPath = outputPath;

    std::vector<Domain::KeepRange> ranges;
    for (const auto& range : keepRanges) {
        if (range.isValid()) ranges.push_back(range);
    }
    std::sort(ranges.begin(), ranges.end(),
              [](const Domain::KeepRange& a, const Domain::KeepRange& b) { return a.start < b.start; });

    try {
        cv::VideoCapture capture(sourcePath);
        if (!capture.isOpened()) {
            result.errorMessage = "cannot open video file " + sourcePath;
            LOG_ERROR(result.errorMessage);
            return result;
        }

        const double sourceFps = capture.get(cv::CAP_PROP_FPS);
        const cv::Size frameSize(static_cast<int>(capture.get(cv::CAP_PROP_FRAME_WIDTH)),
                                 static_cast<int>(capture.get(cv::CAP_PROP_FRAME_HEIGHT)));
        double outputFps = settings_.outputFps > 0.0 ? settings_.outputFps : sourceFps;
        if (outputFps <= 0.0) outputFps = 30.0;

        const int fourcc = settings_.fourcc != 0 ? settings_.fourcc : fourccForPath(outputPath);

        cv::VideoWriter writer;
        if (!writer.open(outputPath, fourcc, outputFps, frameSize, true)) {
            result.errorMessage = "cannot create output video " + outputPath;
            LOG_ERROR(result.errorMessage);
            return result;
        }

        LOG_INFO("Exporting ", ranges.size(), " segments of ", sourcePath, " to ", outputPath, " (",
                 frameSize.width, "x", frameSize.height, " @ ", outputFps, " fps)");

        std::vector<bool> touched(ranges.size(), false);
        cv::Mat frame;
        long index = 0;
        while (capture.read(frame)) {
            const double positionMs = capture.get(cv::CAP_PROP_POS_MSEC);
            Types::Seconds timestamp = positionMs / 1000.0;
            if (positionMs <= 0.0 && index > 0 && sourceFps > 0.0) {
                timestamp = static_cast<double>(index) / sourceFps;
            }
            ++index;

            // Ranges are sorted, so nothing after the last end can be written
            if (ranges.empty() || timestamp >= ranges.back().end) break;

            const int rangeIndex = findRange(ranges, timestamp);
            if (rangeIndex < 0 || frame.empty()) {
                ++result.framesSkipped;
                continue;
            }

            if (frame.size() != frameSize) {
                ++result.framesSkipped;
                LOG_WARN("Frame at ", timestamp, "s has unexpected size, skipped");
                continue;
            }

            writer.write(frame);
            touched[static_cast<size_t>(rangeIndex)] = true;
            ++result.framesWritten;
        }

        result.segmentsWritten = static_cast<int>(std::count(touched.begin(), touched.end(), true));
        result.success = true;
    } catch (const cv::Exception& e) {
        result.success = false;
        result.errorMessage = std::string("OpenCV error: ") + e.what();
        LOG_ERROR("Export to ", outputPath, " failed: ", e.what());
    }

    const auto endTime = std::chrono::steady_clock::now();
    result.processingTimeMs = std::chrono::duration<float, std::milli>(endTime - startTime).count();

    if (result.success) {
        LOG_INFO("Export complete: ", result.framesWritten, " frames written, ",
                 result.framesSkipped, " skipped, ", result.segmentsWritten, " segments");
    }
    return result;
}

int VideoRangeExporter::findRange(const std::vector<Domain::KeepRange>& keepRanges,
                                  Types::Seconds timestamp) {
    // First range whose end lies after the timestamp
    const auto it = std::upper_bound(
        keepRanges.begin(), keepRanges.end(), timestamp,
        [](Types::Seconds t, const Domain::KeepRange& range) { return t < range.end; });
    if (it == keepRanges.end() || timestamp < it->start) return -1;
    return static_cast<int>(it - keepRanges.begin());
}

int VideoRangeExporter::fourccForPath(const std::string& outputPath) {
    std::string ext = std::filesystem::path(outputPath).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".avi") {
        return cv::VideoWriter::fourcc('M', 'J', 'P', 'G');
    }
    return cv::VideoWriter::fourcc('m', 'p', '4', 'v');
}

}  // namespace OverlayCut::Internal::Export

#include "VideoFrameSource.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace OverlayCut::Internal::IO {

VideoFrameSource::SourceSettings::SourceSettings() : processingWidth(640), frameStep(1) {}

VideoFrameSource::VideoFrameSource(const std::string& path, const SourceSettings& settings)
    : path_(path), settings_(settings), capture_(path) {
    if (!capture_.isOpened()) {
        throw std::runtime_error("cannot open video file " + path);
    }
    if (settings_.frameStep < 1) settings_.frameStep = 1;

    fps_ = capture_.get(cv::CAP_PROP_FPS);
    frameCount_ = static_cast<long>(capture_.get(cv::CAP_PROP_FRAME_COUNT));
    sourceSize_ = Types::Size(static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_WIDTH)),
                              static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_HEIGHT)));

    LOG_INFO("Opened ", path_, ": ", sourceSize_.width, "x", sourceSize_.height, ", ", frameCount_,
             " frames at ", fps_, " fps (", getDurationSeconds(), "s)");
}

bool VideoFrameSource::next(Domain::Frame& frame) {
    while (capture_.read(decoded_)) {
        ++decodedIndex_;
        if (decoded_.empty()) continue;
        if (decodedIndex_ % settings_.frameStep != 0) continue;

        frame.index = decodedIndex_;
        frame.timestamp = timestampFor(decodedIndex_);

        if (settings_.processingWidth > 0 && decoded_.cols > settings_.processingWidth) {
            const double scale = static_cast<double>(settings_.processingWidth) / decoded_.cols;
            const int height = std::max(1, static_cast<int>(std::lround(decoded_.rows * scale)));
            cv::resize(decoded_, frame.image, Types::Size(settings_.processingWidth, height), 0, 0,
                       cv::INTER_AREA);
        } else {
            frame.image = decoded_;
        }
        return true;
    }
    return false;
}

Types::Seconds VideoFrameSource::getDurationSeconds() const {
    if (fps_ <= 0.0 || frameCount_ <= 0) return 0.0;
    return static_cast<double>(frameCount_) / fps_;
}

std::string VideoFrameSource::getName() const {
    return path_;
}

Types::Seconds VideoFrameSource::timestampFor(long index) {
    // Position is reported after the read, i.e. for the frame just decoded
    const double positionMs = capture_.get(cv::CAP_PROP_POS_MSEC);
    if (positionMs > 0.0 || index == 0) {
        return positionMs / 1000.0;
    }
    return fps_ > 0.0 ? static_cast<double>(index) / fps_ : 0.0;
}

}  // namespace OverlayCut::Internal::IO

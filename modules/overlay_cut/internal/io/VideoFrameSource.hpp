#pragma once

#include <overlay_cut/interface/IFrameSource.hpp>
#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <opencv2/videoio.hpp>
#include <string>

namespace OverlayCut::Internal::IO {

class VideoFrameSource : public Interface::IFrameSource {
  public:
    struct SourceSettings {
        int processingWidth;  // downscale to this width, aspect preserved; 0 keeps source size
        int frameStep;        // deliver every Nth decoded frame

        SourceSettings();
    };

    // Throws std::runtime_error when the file cannot be opened.
    explicit VideoFrameSource(const std::string& path,
                              const SourceSettings& settings = SourceSettings{});

    bool next(Domain::Frame& frame) override;
    Types::Seconds getDurationSeconds() const override;
    std::string getName() const override;

    double getFps() const { return fps_; }
    long getFrameCount() const { return frameCount_; }
    Types::Size getSourceSize() const { return sourceSize_; }

  private:
    std::string path_;
    SourceSettings settings_;
    cv::VideoCapture capture_;
    cv::Mat decoded_;
    double fps_ = 0.0;
    long frameCount_ = 0;
    long decodedIndex_ = -1;
    Types::Size sourceSize_;

    Types::Seconds timestampFor(long index);
};

}  // namespace OverlayCut::Internal::IO

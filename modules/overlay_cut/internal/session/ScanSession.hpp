#pragma once

#include "../calibration/ReferenceCalibrator.hpp"
#include "../detection/FrameScanner.hpp"
#include "../domain/VisionProfile.hpp"
#include "../timeline/TimelineSegmenter.hpp"
#include <overlay_cut/interface/IConfiguration.hpp>
#include <overlay_cut/interface/IFrameSource.hpp>
#include <shared/types/Common.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace OverlayCut::Internal::Session {

/**
 * Runs one video through calibration, frame scanning and timeline segmentation.
 *
 * Frames are pulled from an IFrameSource in presentation order. cancel() is checked
 * before every frame, the first one included; a cancelled run discards every hit
 * gathered so far and reports ABORTED. A frame whose scan has started always finishes.
 * Each run() clears a previous cancel when it starts.
 */
class ScanSession {
  public:
    // Progress callback: (frames_scanned, percentage, current_timestamp)
    using ProgressCallback = std::function<void(long, float, Types::Seconds)>;

    struct SessionSettings {
        Calibration::ReferenceCalibrator::CalibrationSettings calibration;
        Detection::FrameScanner::ScannerSettings scanner;
        Timeline::TimelineSegmenter::SegmenterSettings timeline;

        int progressInterval;  // report progress every N scanned frames
        int numThreads;        // 0 = auto-detect, 1 = scan on the calling thread

        SessionSettings();

        static SessionSettings fromConfiguration(const Interface::IConfiguration& config);
    };

    struct Result {
        Types::SessionStatus status = Types::SessionStatus::IDLE;
        Timeline::TimelineSegmenter::Segmentation segmentation;

        long framesScanned = 0;
        long framesWithHits = 0;
        long faultedFrames = 0;
        Types::Seconds duration = 0.0;
        float processingTimeMs = 0.0f;
        std::string errorMessage;

        bool isSuccess() const { return status == Types::SessionStatus::COMPLETED; }
        std::string getSummary() const;
    };

    explicit ScanSession(const SessionSettings& settings = SessionSettings{});

    // Throws Domain::CalibrationError; the session is left FAILED in that case.
    Domain::VisionProfile calibrate(const Types::Image& referenceImage);

    // Calibrates, then scans. Calibration errors propagate before any frame is read.
    Result run(const Types::Image& referenceImage, Interface::IFrameSource& source);

    Result run(const Domain::VisionProfile& profile, Interface::IFrameSource& source);

    // Control methods
    void cancel();
    bool isCancelled() const;
    bool isRunning() const;
    Types::SessionStatus getStatus() const;

    void setProgressCallback(ProgressCallback callback);
    SessionSettings getSettings() const;

  private:
    struct ScanTally {
        std::vector<Types::Seconds> hits;
        long framesScanned = 0;
        long faultedFrames = 0;
        Types::Seconds lastTimestamp = 0.0;
    };

    SessionSettings settings_;
    Calibration::ReferenceCalibrator calibrator_;
    Detection::FrameScanner scanner_;
    Timeline::TimelineSegmenter segmenter_;
    unsigned int numThreads_;

    std::atomic<Types::SessionStatus> status_;
    std::atomic<bool> shouldStop_;

    ProgressCallback progressCallback_;
    mutable std::mutex progressMutex_;

    Result runScan(const Domain::VisionProfile& profile, Interface::IFrameSource& source);
    void scanSequential(const Domain::VisionProfile& profile, Interface::IFrameSource& source,
                        Types::Seconds duration, ScanTally& tally);
    void scanParallel(const Domain::VisionProfile& profile, Interface::IFrameSource& source,
                      Types::Seconds duration, ScanTally& tally);
    void updateProgress(long framesScanned, Types::Seconds timestamp, Types::Seconds duration);
};

}  // namespace OverlayCut::Internal::Session

#include "ScanSession.hpp"

#include "../domain/Errors.hpp"
#include <shared/utils/Logger.hpp>
#include <opencv2/core.hpp>
#include <algorithm>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace OverlayCut::Internal::Session {

namespace {

constexpr unsigned int FRAMES_PER_WORKER = 8;

struct FrameOutcome {
    bool scanned = false;
    bool hit = false;
    bool faulted = false;
};

}  // namespace

ScanSession::SessionSettings::SessionSettings() : progressInterval(30), numThreads(1) {}

ScanSession::SessionSettings ScanSession::SessionSettings::fromConfiguration(
    const Interface::IConfiguration& config) {
    SessionSettings settings;

    settings.calibration.backgroundColor = config.getBackgroundColor();
    settings.calibration.backgroundTolerance = config.getBackgroundTolerance();
    settings.calibration.accentColor = config.getAccentColor();
    settings.calibration.accentTolerance = config.getAccentTolerance();
    settings.calibration.textLower = config.getTextLower();
    settings.calibration.textUpper = config.getTextUpper();
    settings.calibration.minAreaRatio = config.getMinCalibrationAreaRatio();

    settings.scanner.minIoU = config.getMinIoU();
    settings.scanner.minAccentRatio = config.getMinAccentRatio();
    settings.scanner.minTextRatio = config.getMinTextRatio();

    settings.timeline.clusterTolerance = config.getClusterTolerance();
    settings.timeline.minSegment = config.getMinSegment();

    settings.progressInterval = config.getProgressInterval();
    settings.numThreads = config.getThreadCount();
    return settings;
}

std::string ScanSession::Result::getSummary() const {
    std::ostringstream oss;
    oss << "Scan " << Types::toString(status) << ": " << framesScanned << " frames scanned, "
        << framesWithHits << " with overlay, " << faultedFrames << " faulted";
    if (isSuccess()) {
        oss << "; " << segmentation.detections.size() << " overlay ranges, "
            << segmentation.keepRanges.size() << " clean segments, " << segmentation.keptSeconds()
            << "s of " << duration << "s kept";
    }
    oss << " (" << processingTimeMs << " ms)";
    if (!errorMessage.empty()) oss << " - " << errorMessage;
    return oss.str();
}

ScanSession::ScanSession(const SessionSettings& settings)
    : settings_(settings),
      calibrator_(settings.calibration),
      scanner_(settings.scanner),
      segmenter_(settings.timeline),
      status_(Types::SessionStatus::IDLE),
      shouldStop_(false) {
    if (settings_.numThreads <= 0) {
        numThreads_ = std::max(1u, std::thread::hardware_concurrency());
    } else {
        numThreads_ = static_cast<unsigned int>(settings_.numThreads);
    }
    if (settings_.progressInterval < 1) settings_.progressInterval = 1;

    LOG_DEBUG("Scan session initialized with ", numThreads_, " thread(s)");
}

Domain::VisionProfile ScanSession::calibrate(const Types::Image& referenceImage) {
    status_ = Types::SessionStatus::CALIBRATING;
    try {
        return calibrator_.calibrate(referenceImage);
    } catch (const Domain::CalibrationError& e) {
        status_ = Types::SessionStatus::FAILED;
        LOG_ERROR("Calibration failed: ", e.what());
        throw;
    }
}

ScanSession::Result ScanSession::run(const Types::Image& referenceImage,
                                     Interface::IFrameSource& source) {
    // Cleared before calibrating so a cancel issued meanwhile still aborts the scan
    shouldStop_ = false;
    const Domain::VisionProfile profile = calibrate(referenceImage);
    return runScan(profile, source);
}

ScanSession::Result ScanSession::run(const Domain::VisionProfile& profile,
                                     Interface::IFrameSource& source) {
    shouldStop_ = false;
    return runScan(profile, source);
}

ScanSession::Result ScanSession::runScan(const Domain::VisionProfile& profile,
                                         Interface::IFrameSource& source) {
    const auto startTime = std::chrono::steady_clock::now();
    status_ = Types::SessionStatus::SCANNING;

    LOG_INFO("Scanning ", source.getName(), " against ", profile.describe());

    Result result;
    ScanTally tally;
    const Types::Seconds reportedDuration = source.getDurationSeconds();

    try {
        if (numThreads_ > 1) {
            scanParallel(profile, source, reportedDuration, tally);
        } else {
            scanSequential(profile, source, reportedDuration, tally);
        }

        result.framesScanned = tally.framesScanned;
        result.framesWithHits = static_cast<long>(tally.hits.size());
        result.faultedFrames = tally.faultedFrames;
        result.duration = reportedDuration > 0.0 ? reportedDuration : tally.lastTimestamp;

        if (shouldStop_) {
            result.status = Types::SessionStatus::ABORTED;
            LOG_WARN("Scan cancelled after ", tally.framesScanned, " frames; ",
                     tally.hits.size(), " hits discarded");
        } else {
            result.segmentation = segmenter_.segmentTimestamps(tally.hits, result.duration);
            result.status = Types::SessionStatus::COMPLETED;
        }
    } catch (const cv::Exception& e) {
        result.status = Types::SessionStatus::FAILED;
        result.errorMessage = std::string("OpenCV error: ") + e.what();
        LOG_ERROR("Scan of ", source.getName(), " failed: ", e.what());
    } catch (const std::exception& e) {
        result.status = Types::SessionStatus::FAILED;
        result.errorMessage = e.what();
        LOG_ERROR("Scan of ", source.getName(), " failed: ", e.what());
    }

    const auto endTime = std::chrono::steady_clock::now();
    result.processingTimeMs =
        std::chrono::duration<float, std::milli>(endTime - startTime).count();
    status_ = result.status;

    LOG_INFO(result.getSummary());
    return result;
}

void ScanSession::cancel() {
    shouldStop_ = true;
}

bool ScanSession::isCancelled() const {
    return shouldStop_;
}

bool ScanSession::isRunning() const {
    const Types::SessionStatus status = status_;
    return status == Types::SessionStatus::CALIBRATING || status == Types::SessionStatus::SCANNING;
}

Types::SessionStatus ScanSession::getStatus() const {
    return status_;
}

void ScanSession::setProgressCallback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(progressMutex_);
    progressCallback_ = std::move(callback);
}

ScanSession::SessionSettings ScanSession::getSettings() const {
    return settings_;
}

void ScanSession::scanSequential(const Domain::VisionProfile& profile,
                                 Interface::IFrameSource& source, Types::Seconds duration,
                                 ScanTally& tally) {
    Domain::Frame frame;
    while (!shouldStop_ && source.next(frame)) {
        bool faulted = false;
        const Domain::DetectionEvent event = scanner_.scan(frame, profile, &faulted);

        ++tally.framesScanned;
        if (faulted) ++tally.faultedFrames;
        if (event.hit) tally.hits.push_back(event.timestamp);
        tally.lastTimestamp = std::max(tally.lastTimestamp, frame.timestamp);

        if (tally.framesScanned % settings_.progressInterval == 0) {
            updateProgress(tally.framesScanned, frame.timestamp, duration);
        }
    }
}

void ScanSession::scanParallel(const Domain::VisionProfile& profile,
                               Interface::IFrameSource& source, Types::Seconds duration,
                               ScanTally& tally) {
    const size_t batchSize = static_cast<size_t>(numThreads_) * FRAMES_PER_WORKER;
    std::mutex hitsMutex;
    long nextReport = settings_.progressInterval;

    std::vector<Domain::Frame> batch;
    batch.reserve(batchSize);

    while (!shouldStop_) {
        batch.clear();
        Domain::Frame frame;
        while (batch.size() < batchSize && source.next(frame)) {
            // Sources may reuse their decode buffer
            Domain::Frame owned;
            owned.image = frame.image.clone();
            owned.timestamp = frame.timestamp;
            owned.index = frame.index;
            batch.push_back(std::move(owned));
        }
        if (batch.empty()) break;

        std::vector<FrameOutcome> outcomes(batch.size());
        const unsigned int workerCount =
            std::min<unsigned int>(numThreads_, static_cast<unsigned int>(batch.size()));

        std::vector<std::thread> workers;
        workers.reserve(workerCount);
        for (unsigned int w = 0; w < workerCount; ++w) {
            workers.emplace_back([&, w]() {
                for (size_t i = w; i < batch.size(); i += workerCount) {
                    if (shouldStop_) return;
                    bool faulted = false;
                    const Domain::DetectionEvent event = scanner_.scan(batch[i], profile, &faulted);
                    outcomes[i].scanned = true;
                    outcomes[i].hit = event.hit;
                    outcomes[i].faulted = faulted;
                    if (event.hit) {
                        std::lock_guard<std::mutex> lock(hitsMutex);
                        tally.hits.push_back(event.timestamp);
                    }
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        for (size_t i = 0; i < batch.size(); ++i) {
            if (!outcomes[i].scanned) continue;
            ++tally.framesScanned;
            if (outcomes[i].faulted) ++tally.faultedFrames;
            tally.lastTimestamp = std::max(tally.lastTimestamp, batch[i].timestamp);
        }

        if (tally.framesScanned >= nextReport) {
            updateProgress(tally.framesScanned, batch.back().timestamp, duration);
            nextReport = tally.framesScanned + settings_.progressInterval;
        }
    }

    std::sort(tally.hits.begin(), tally.hits.end());
}

void ScanSession::updateProgress(long framesScanned, Types::Seconds timestamp,
                                 Types::Seconds duration) {
    ProgressCallback callback;
    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        callback = progressCallback_;
    }

    float percentage = 0.0f;
    if (duration > 0.0) {
        percentage = static_cast<float>(std::min(100.0, timestamp / duration * 100.0));
    }

    LOG_DEBUG("Progress: ", framesScanned, " frames, ", percentage, "% at ", timestamp, "s");
    if (callback) {
        callback(framesScanned, percentage, timestamp);
    }
}

}  // namespace OverlayCut::Internal::Session

#pragma once

#include "../domain/DetectionEvent.hpp"
#include "../domain/Frame.hpp"
#include "../domain/VisionProfile.hpp"
#include "../processing/ColorSegmenter.hpp"
#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <string>
#include <vector>

namespace OverlayCut::Internal::Detection {

/**
 * Tests a single frame for the calibrated overlay.
 *
 * Candidates come from the background color mask. A candidate must overlap the
 * projected template box (spatial lock) and contain both accent and text colors
 * (triad check). The scanner never modifies or keeps the frame.
 */
class FrameScanner {
  public:
    struct ScannerSettings {
        double minIoU;           // spatial lock
        double minAccentRatio;   // triad check, exclusive
        double minTextRatio;     // triad check, exclusive
        bool debug;              // log per-candidate measurements

        ScannerSettings();
    };

    struct CandidateReport {
        Types::Rect boundingBox;
        double iou = 0.0;
        double accentRatio = 0.0;
        double textRatio = 0.0;
        bool spatiallyLocked = false;
        bool passedTriad = false;
    };

    explicit FrameScanner(const ScannerSettings& settings = ScannerSettings{});

    // Per-frame failures are logged and reported as a miss; faulted, when given, records whether one occurred.
    Domain::DetectionEvent scan(const Domain::Frame& frame, const Domain::VisionProfile& profile,
                                bool* faulted = nullptr) const;

    // Same as scan() but lets FrameScanError and cv::Exception propagate and reports every candidate.
    Domain::DetectionEvent scanDetailed(const Domain::Frame& frame,
                                        const Domain::VisionProfile& profile,
                                        std::vector<CandidateReport>* reports) const;

    void setSettings(const ScannerSettings& settings);
    ScannerSettings getSettings() const;

  private:
    ScannerSettings settings_;

    std::vector<Processing::Blob> orderCandidates(std::vector<Processing::Blob> blobs) const;
};

}  // namespace OverlayCut::Internal::Detection

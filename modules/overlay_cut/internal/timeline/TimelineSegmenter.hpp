#pragma once

#include "RangeInverter.hpp"
#include "TemporalClusterer.hpp"
#include "../domain/DetectionEvent.hpp"
#include "../domain/TimeRange.hpp"
#include <shared/types/Common.hpp>
#include <vector>

namespace OverlayCut::Internal::Timeline {

class TimelineSegmenter {
  public:
    struct SegmenterSettings {
        Types::Seconds clusterTolerance;
        Types::Seconds minSegment;

        SegmenterSettings();
    };

    struct Segmentation {
        std::vector<Domain::DetectionRange> detections;
        std::vector<Domain::KeepRange> keepRanges;
        Types::Seconds duration = 0.0;

        Types::Seconds keptSeconds() const;
        Types::Seconds removedSeconds() const { return duration - keptSeconds(); }
    };

    explicit TimelineSegmenter(const SegmenterSettings& settings = SegmenterSettings{});

    // Clusters the hit events (misses are ignored) and inverts them against [0, duration].
    Segmentation segment(const std::vector<Domain::DetectionEvent>& events,
                         Types::Seconds duration) const;

    Segmentation segmentTimestamps(const std::vector<Types::Seconds>& hitTimestamps,
                                   Types::Seconds duration) const;

    SegmenterSettings getSettings() const { return settings_; }

  private:
    SegmenterSettings settings_;
    TemporalClusterer clusterer_;
    RangeInverter inverter_;
};

}  // namespace OverlayCut::Internal::Timeline

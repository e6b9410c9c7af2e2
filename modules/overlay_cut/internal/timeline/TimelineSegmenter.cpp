#include "TimelineSegmenter.hpp"

#include <shared/utils/Logger.hpp>

namespace OverlayCut::Internal::Timeline {

TimelineSegmenter::SegmenterSettings::SegmenterSettings()
    : clusterTolerance(Types::DEFAULT_CLUSTER_TOLERANCE), minSegment(Types::DEFAULT_MIN_SEGMENT) {}

Types::Seconds TimelineSegmenter::Segmentation::keptSeconds() const {
    Types::Seconds total = 0.0;
    for (const auto& range : keepRanges) total += range.length();
    return total;
}

TimelineSegmenter::TimelineSegmenter(const SegmenterSettings& settings)
    : settings_(settings),
      clusterer_(settings.clusterTolerance),
      inverter_(settings.minSegment) {}

TimelineSegmenter::Segmentation TimelineSegmenter::segment(
    const std::vector<Domain::DetectionEvent>& events, Types::Seconds duration) const {
    std::vector<Types::Seconds> hits;
    hits.reserve(events.size());
    for (const auto& event : events) {
        if (event.hit) hits.push_back(event.timestamp);
    }
    return segmentTimestamps(hits, duration);
}

TimelineSegmenter::Segmentation TimelineSegmenter::segmentTimestamps(
    const std::vector<Types::Seconds>& hitTimestamps, Types::Seconds duration) const {
    Segmentation result;
    result.duration = duration;
    result.detections = clusterer_.cluster(hitTimestamps);
    result.keepRanges = inverter_.invert(result.detections, duration);

    LOG_INFO("Timeline: ", result.detections.size(), " overlay ranges, ",
             result.keepRanges.size(), " clean segments (", result.keptSeconds(), "s of ",
             duration, "s kept)");
    return result;
}

}  // namespace OverlayCut::Internal::Timeline

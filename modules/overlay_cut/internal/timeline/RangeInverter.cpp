#include "RangeInverter.hpp"

#include <shared/utils/Logger.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace OverlayCut::Internal::Timeline {

RangeInverter::RangeInverter(Types::Seconds minSegment) {
    setMinSegment(minSegment);
}

void RangeInverter::setMinSegment(Types::Seconds minSegment) {
    if (!(minSegment >= 0.0)) {
        throw std::invalid_argument("minimum segment length must be non-negative");
    }
    minSegment_ = minSegment;
}

std::vector<Domain::KeepRange> RangeInverter::invert(std::vector<Domain::DetectionRange> detections,
                                                     Types::Seconds duration) const {
    if (!(duration >= 0.0) || !std::isfinite(duration)) {
        throw std::invalid_argument("duration must be a non-negative finite number of seconds");
    }
    for (const auto& detection : detections) {
        if (!detection.isValid()) {
            throw std::invalid_argument("detection range starts after it ends");
        }
    }

    std::vector<Domain::KeepRange> keep;

    // An empty timeline has nothing to keep
    if (duration <= 0.0) return keep;

    if (detections.empty()) {
        keep.push_back(Domain::KeepRange{0.0, duration});
        return keep;
    }

    std::sort(detections.begin(), detections.end(),
              [](const Domain::DetectionRange& a, const Domain::DetectionRange& b) {
                  return a.start < b.start;
              });

    Types::Seconds cursor = 0.0;
    for (const auto& detection : detections) {
        // Strict comparison: a gap of exactly minSegment is not worth an edit point
        const Types::Seconds gapEnd = std::min(detection.start, duration);
        if (gapEnd > cursor + minSegment_) {
            keep.push_back(Domain::KeepRange{cursor, gapEnd});
        }
        cursor = std::max(cursor, detection.end);
    }

    if (cursor < duration - minSegment_) {
        keep.push_back(Domain::KeepRange{cursor, duration});
    }

    LOG_DEBUG("Inverted ", detections.size(), " detections over ", duration, "s into ",
              keep.size(), " keep ranges");
    return keep;
}

}  // namespace OverlayCut::Internal::Timeline

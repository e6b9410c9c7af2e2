#include "TemporalClusterer.hpp"

#include <shared/utils/Logger.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace OverlayCut::Internal::Timeline {

TemporalClusterer::TemporalClusterer(Types::Seconds tolerance) {
    setTolerance(tolerance);
}

void TemporalClusterer::setTolerance(Types::Seconds tolerance) {
    if (!(tolerance >= 0.0)) {
        throw std::invalid_argument("cluster tolerance must be non-negative");
    }
    tolerance_ = tolerance;
}

std::vector<Domain::DetectionRange> TemporalClusterer::cluster(
    std::vector<Types::Seconds> timestamps) const {
    std::vector<Domain::DetectionRange> ranges;
    if (timestamps.empty()) return ranges;

    for (Types::Seconds t : timestamps) {
        if (!std::isfinite(t)) {
            throw std::invalid_argument("detection timestamps must be finite");
        }
    }

    std::sort(timestamps.begin(), timestamps.end());

    Types::Seconds start = timestamps.front();
    Types::Seconds previous = timestamps.front();

    for (size_t i = 1; i < timestamps.size(); ++i) {
        const Types::Seconds current = timestamps[i];
        if (current - previous > tolerance_) {
            ranges.push_back(Domain::DetectionRange{start, previous, 1.0f});
            start = current;
        }
        previous = current;
    }
    ranges.push_back(Domain::DetectionRange{start, previous, 1.0f});

    LOG_DEBUG("Clustered ", timestamps.size(), " hits into ", ranges.size(), " ranges");
    return ranges;
}

}  // namespace OverlayCut::Internal::Timeline

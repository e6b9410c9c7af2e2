#pragma once

#include <shared/types/Common.hpp>

namespace OverlayCut::Domain {

struct DetectionEvent {
    Types::Seconds timestamp = 0.0;
    bool hit = false;
    Types::ConfidenceScore confidence;

    static DetectionEvent miss(Types::Seconds timestamp) {
        return DetectionEvent{timestamp, false, Types::ConfidenceScore::fromValue(0.0f)};
    }

    static DetectionEvent detected(Types::Seconds timestamp, float confidence) {
        return DetectionEvent{timestamp, true, Types::ConfidenceScore::fromValue(confidence)};
    }
};

}  // namespace OverlayCut::Domain

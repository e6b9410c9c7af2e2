#pragma once

#include <shared/types/Common.hpp>
#include <ostream>

namespace OverlayCut::Domain {

// Contiguous period during which the overlay was judged present.
struct DetectionRange {
    Types::Seconds start = 0.0;
    Types::Seconds end = 0.0;
    float confidence = 1.0f;

    Types::Seconds length() const { return end - start; }
    bool isValid() const { return start <= end; }
};

// Footage to retain in the exported cut.
struct KeepRange {
    Types::Seconds start = 0.0;
    Types::Seconds end = 0.0;

    Types::Seconds length() const { return end - start; }
    bool isValid() const { return start < end; }
};

inline std::ostream& operator<<(std::ostream& os, const DetectionRange& range) {
    return os << "{" << range.start << ", " << range.end << ", " << range.confidence << "}";
}

inline std::ostream& operator<<(std::ostream& os, const KeepRange& range) {
    return os << "{" << range.start << ", " << range.end << "}";
}

}  // namespace OverlayCut::Domain

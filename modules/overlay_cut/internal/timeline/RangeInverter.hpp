#pragma once

#include "../domain/TimeRange.hpp"
#include <shared/types/Common.hpp>
#include <vector>

namespace OverlayCut::Internal::Timeline {

// Complement of detected ranges over [0, duration], dropping gaps not longer than minSegment.
class RangeInverter {
  public:
    explicit RangeInverter(Types::Seconds minSegment = Types::DEFAULT_MIN_SEGMENT);

    // Throws std::invalid_argument on negative duration or a range with start > end.
    std::vector<Domain::KeepRange> invert(std::vector<Domain::DetectionRange> detections,
                                          Types::Seconds duration) const;

    Types::Seconds getMinSegment() const { return minSegment_; }
    void setMinSegment(Types::Seconds minSegment);

  private:
    Types::Seconds minSegment_;
};

}  // namespace OverlayCut::Internal::Timeline

#pragma once

#include "../domain/TimeRange.hpp"
#include <shared/types/Common.hpp>
#include <vector>

namespace OverlayCut::Internal::Timeline {

// Merges hit timestamps into continuous ranges. Input order does not matter.
class TemporalClusterer {
  public:
    explicit TemporalClusterer(Types::Seconds tolerance = Types::DEFAULT_CLUSTER_TOLERANCE);

    std::vector<Domain::DetectionRange> cluster(std::vector<Types::Seconds> timestamps) const;

    Types::Seconds getTolerance() const { return tolerance_; }
    void setTolerance(Types::Seconds tolerance);

  private:
    Types::Seconds tolerance_;
};

}  // namespace OverlayCut::Internal::Timeline

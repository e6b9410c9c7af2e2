#pragma once

#include <shared/types/Common.hpp>

namespace OverlayCut::Internal::Detection {

class SpatialMatcher {
  public:
    // Overlap area over union area; 0 when the boxes do not intersect or both are empty.
    static double intersectionOverUnion(const Types::Rect& a, const Types::Rect& b);

    static bool isLocked(const Types::Rect& candidate, const Types::Rect& expected,
                         double minIoU);
};

}  // namespace OverlayCut::Internal::Detection

#include "SpatialMatcher.hpp"

#include <algorithm>

namespace OverlayCut::Internal::Detection {

double SpatialMatcher::intersectionOverUnion(const Types::Rect& a, const Types::Rect& b) {
    const int left = std::max(a.x, b.x);
    const int top = std::max(a.y, b.y);
    const int right = std::min(a.x + a.width, b.x + b.width);
    const int bottom = std::min(a.y + a.height, b.y + b.height);

    const int overlapWidth = right - left;
    const int overlapHeight = bottom - top;
    if (overlapWidth <= 0 || overlapHeight <= 0) return 0.0;

    const double overlap = static_cast<double>(overlapWidth) * overlapHeight;
    const double areaA = static_cast<double>(a.width) * a.height;
    const double areaB = static_cast<double>(b.width) * b.height;
    const double unionArea = areaA + areaB - overlap;

    return unionArea > 0.0 ? overlap / unionArea : 0.0;
}

bool SpatialMatcher::isLocked(const Types::Rect& candidate, const Types::Rect& expected,
                              double minIoU) {
    return intersectionOverUnion(candidate, expected) >= minIoU;
}

}  // namespace OverlayCut::Internal::Detection

#pragma once

#include "../domain/ColorRange.hpp"
#include <shared/types/Common.hpp>
#include <opencv2/core.hpp>
#include <vector>

namespace OverlayCut::Internal::Processing {

// One external connected region of a binary mask.
struct Blob {
    double area = 0.0;
    Types::Rect boundingBox;
    int discoveryIndex = 0;
};

class ColorSegmenter {
  public:
    static Types::Image threshold(const Types::Image& hsv, const Domain::ColorRange& range);

    // External contours only; holes left by accent and text pixels do not split the panel.
    static std::vector<Blob> extractBlobs(const Types::Image& mask);

    static std::vector<Blob> segment(const Types::Image& hsv, const Domain::ColorRange& range);

    // Fraction of pixels in hsvRoi inside range, over the ROI area.
    static double matchRatio(const Types::Image& hsvRoi, const Domain::ColorRange& range);
};

}  // namespace OverlayCut::Internal::Processing

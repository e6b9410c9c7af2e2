#pragma once

#include <shared/types/Common.hpp>
#include <opencv2/core.hpp>
#include <cmath>
#include <sstream>
#include <string>

namespace OverlayCut::Domain {

// Overlay position and size relative to the frame, independent of resolution.
struct SpatialTemplate {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    double aspectRatio = 0.0;  // measured on the pixel box, before normalization

    static SpatialTemplate fromPixelBox(const Types::Rect& box, const Types::Size& imageSize) {
        SpatialTemplate spatial;
        if (imageSize.width <= 0 || imageSize.height <= 0) return spatial;

        spatial.x = static_cast<double>(box.x) / imageSize.width;
        spatial.y = static_cast<double>(box.y) / imageSize.height;
        spatial.width = static_cast<double>(box.width) / imageSize.width;
        spatial.height = static_cast<double>(box.height) / imageSize.height;
        spatial.aspectRatio =
            box.height > 0 ? static_cast<double>(box.width) / box.height : 0.0;
        return spatial;
    }

    Types::Rect project(const Types::Size& frameSize) const {
        return Types::Rect(static_cast<int>(std::floor(x * frameSize.width)),
                           static_cast<int>(std::floor(y * frameSize.height)),
                           static_cast<int>(std::floor(width * frameSize.width)),
                           static_cast<int>(std::floor(height * frameSize.height)));
    }

    bool isValid(double tolerance = 1e-6) const {
        return x >= 0.0 && y >= 0.0 && width > 0.0 && height > 0.0 &&
               x + width <= 1.0 + tolerance && y + height <= 1.0 + tolerance;
    }

    std::string toString() const {
        std::ostringstream oss;
        oss.precision(4);
        oss << std::fixed << "x=" << x << ", y=" << y << ", w=" << width << ", h=" << height
            << ", aspect=" << aspectRatio;
        return oss.str();
    }
};

}  // namespace OverlayCut::Domain

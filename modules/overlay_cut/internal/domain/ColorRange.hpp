#pragma once

#include <shared/types/Common.hpp>
#include <opencv2/core.hpp>
#include <algorithm>
#include <sstream>
#include <string>

namespace OverlayCut::Domain {

// Inclusive HSV window in OpenCV's 8-bit discretization.
struct ColorRange {
    Types::HsvTriple lower{0.0, 0.0, 0.0};
    Types::HsvTriple upper{Types::HSV_HUE_MAX, Types::HSV_SATURATION_MAX, Types::HSV_VALUE_MAX};

    static ColorRange fromBounds(const Types::HsvTriple& lower, const Types::HsvTriple& upper) {
        ColorRange range;
        range.lower = clampToDomain(lower);
        range.upper = clampToDomain(upper);
        return range;
    }

    // Widens a single HSV triple by a per-channel tolerance and clamps to the domain.
    static ColorRange around(const Types::HsvTriple& center, double toleranceH, double toleranceS,
                             double toleranceV) {
        return fromBounds({center[0] - toleranceH, center[1] - toleranceS, center[2] - toleranceV},
                          {center[0] + toleranceH, center[1] + toleranceS, center[2] + toleranceV});
    }

    static Types::HsvTriple clampToDomain(const Types::HsvTriple& hsv) {
        return {std::clamp(hsv[0], 0.0, Types::HSV_HUE_MAX),
                std::clamp(hsv[1], 0.0, Types::HSV_SATURATION_MAX),
                std::clamp(hsv[2], 0.0, Types::HSV_VALUE_MAX)};
    }

    cv::Scalar lowerScalar() const { return cv::Scalar(lower[0], lower[1], lower[2]); }
    cv::Scalar upperScalar() const { return cv::Scalar(upper[0], upper[1], upper[2]); }

    bool contains(const Types::HsvTriple& hsv) const {
        for (int i = 0; i < 3; ++i) {
            if (hsv[i] < lower[i] || hsv[i] > upper[i]) return false;
        }
        return true;
    }

    bool isValid() const {
        for (int i = 0; i < 3; ++i) {
            if (lower[i] > upper[i]) return false;
        }
        return lower == clampToDomain(lower) && upper == clampToDomain(upper);
    }

    std::string toString() const {
        std::ostringstream oss;
        oss << "[" << lower[0] << "," << lower[1] << "," << lower[2] << "]-[" << upper[0] << ","
            << upper[1] << "," << upper[2] << "]";
        return oss.str();
    }
};

}  // namespace OverlayCut::Domain

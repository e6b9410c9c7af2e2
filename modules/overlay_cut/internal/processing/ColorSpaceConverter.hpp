#pragma once

#include "../domain/ColorRange.hpp"
#include "../domain/Errors.hpp"
#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace OverlayCut::Internal::Processing {

class ColorSpaceConverter {
  public:
    ColorSpaceConverter() = default;

    // sRGB to OpenCV HSV: hue halved to [0,180], saturation and value scaled to [0,255]
    static Types::HsvTriple rgbToHsv(const Types::Rgb& rgb) {
        const double r = rgb.r / 255.0;
        const double g = rgb.g / 255.0;
        const double b = rgb.b / 255.0;

        const double maxC = std::max({r, g, b});
        const double minC = std::min({r, g, b});
        const double delta = maxC - minC;

        double hue = 0.0;
        if (delta > 0.0) {
            if (maxC == r) {
                hue = 60.0 * std::fmod((g - b) / delta, 6.0);
            } else if (maxC == g) {
                hue = 60.0 * ((b - r) / delta + 2.0);
            } else {
                hue = 60.0 * ((r - g) / delta + 4.0);
            }
        }
        if (hue < 0.0) hue += 360.0;

        const double saturation = maxC == 0.0 ? 0.0 : delta / maxC;

        return {hue / 2.0, saturation * Types::HSV_SATURATION_MAX, maxC * Types::HSV_VALUE_MAX};
    }

    static Domain::ColorRange rangeFromColor(const Types::Rgb& rgb, double toleranceH,
                                             double toleranceS, double toleranceV) {
        return Domain::ColorRange::around(rgbToHsv(rgb), toleranceH, toleranceS, toleranceV);
    }

    // BGR, BGRA or single-channel 8-bit input to an 8-bit HSV image.
    static Types::Image toHsv(const Types::Image& image) {
        if (image.empty()) {
            throw Domain::FrameScanError("image is empty");
        }
        if (image.depth() != CV_8U) {
            throw Domain::FrameScanError("unsupported pixel depth " + std::to_string(image.depth()) +
                                         ", expected 8-bit channels");
        }

        Types::Image bgr;
        switch (image.channels()) {
            case 3:
                bgr = image;
                break;
            case 4:
                cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
                break;
            case 1:
                cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
                break;
            default:
                throw Domain::FrameScanError("unsupported channel layout: " +
                                             std::to_string(image.channels()) + " channels");
        }

        Types::Image hsv;
        cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);
        return hsv;
    }
};

}  // namespace OverlayCut::Internal::Processing

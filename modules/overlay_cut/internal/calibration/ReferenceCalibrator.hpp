#pragma once

#include "../domain/ColorRange.hpp"
#include "../domain/Errors.hpp"
#include "../domain/VisionProfile.hpp"
#include <shared/types/Common.hpp>
#include <shared/utils/Logger.hpp>

namespace OverlayCut::Internal::Calibration {

class ReferenceCalibrator {
  public:
    struct CalibrationSettings {
        // Menu panel background; wide tolerance since reference lighting varies
        Types::Rgb backgroundColor;
        Types::HsvTriple backgroundTolerance;

        // Selection bar
        Types::Rgb accentColor;
        Types::HsvTriple accentTolerance;

        // Text is matched by low saturation and high value rather than by hue
        Types::HsvTriple textLower;
        Types::HsvTriple textUpper;

        // Largest region must cover more than this fraction of the image
        double minAreaRatio;

        CalibrationSettings();

        Domain::ColorRange backgroundRange() const;
        Domain::ColorRange accentRange() const;
        Domain::ColorRange textRange() const;
    };

    explicit ReferenceCalibrator(const CalibrationSettings& settings = CalibrationSettings{});

    // Throws Domain::CalibrationError when no qualifying region is found.
    Domain::VisionProfile calibrate(const Types::Image& referenceImage) const;

    void setSettings(const CalibrationSettings& settings);
    CalibrationSettings getSettings() const;

  private:
    CalibrationSettings settings_;
};

}  // namespace OverlayCut::Internal::Calibration

#pragma once

#include <shared/types/Common.hpp>
#include <map>
#include <memory>
#include <string>

namespace OverlayCut::Interface {

class IConfiguration {
  public:
    virtual ~IConfiguration() = default;

    // Target colors and tolerances
    virtual Types::Rgb getBackgroundColor() const = 0;
    virtual void setBackgroundColor(const Types::Rgb& color) = 0;
    virtual Types::HsvTriple getBackgroundTolerance() const = 0;
    virtual void setBackgroundTolerance(const Types::HsvTriple& tolerance) = 0;

    virtual Types::Rgb getAccentColor() const = 0;
    virtual void setAccentColor(const Types::Rgb& color) = 0;
    virtual Types::HsvTriple getAccentTolerance() const = 0;
    virtual void setAccentTolerance(const Types::HsvTriple& tolerance) = 0;

    virtual Types::HsvTriple getTextLower() const = 0;
    virtual Types::HsvTriple getTextUpper() const = 0;
    virtual void setTextRange(const Types::HsvTriple& lower, const Types::HsvTriple& upper) = 0;

    // Calibration and detection thresholds
    virtual double getMinCalibrationAreaRatio() const = 0;
    virtual void setMinCalibrationAreaRatio(double ratio) = 0;

    virtual double getMinIoU() const = 0;
    virtual void setMinIoU(double iou) = 0;

    virtual double getMinAccentRatio() const = 0;
    virtual void setMinAccentRatio(double ratio) = 0;

    virtual double getMinTextRatio() const = 0;
    virtual void setMinTextRatio(double ratio) = 0;

    // Timeline
    virtual Types::Seconds getClusterTolerance() const = 0;
    virtual void setClusterTolerance(Types::Seconds tolerance) = 0;

    virtual Types::Seconds getMinSegment() const = 0;
    virtual void setMinSegment(Types::Seconds minSegment) = 0;

    // Frame sampling and scheduling
    virtual int getProcessingWidth() const = 0;
    virtual void setProcessingWidth(int width) = 0;

    virtual int getFrameStep() const = 0;
    virtual void setFrameStep(int step) = 0;

    virtual int getProgressInterval() const = 0;
    virtual void setProgressInterval(int frames) = 0;

    virtual int getThreadCount() const = 0;
    virtual void setThreadCount(int count) = 0;

    // Configuration persistence
    virtual bool loadFromFile(const std::string& filename) = 0;
    virtual bool saveToFile(const std::string& filename) const = 0;
    virtual bool loadFromString(const std::string& configString) = 0;
    virtual std::string saveToString() const = 0;

    // Runtime configuration
    virtual void setParameter(const std::string& key, const std::string& value) = 0;
    virtual std::string getParameter(const std::string& key) const = 0;
    virtual std::map<std::string, std::string> getAllParameters() const = 0;

    virtual bool isValid() const = 0;
    virtual void reset() = 0;
    virtual void validate() = 0;
};

// Factory function for creating default configuration
std::unique_ptr<IConfiguration> createDefaultConfiguration();

}  // namespace OverlayCut::Interface

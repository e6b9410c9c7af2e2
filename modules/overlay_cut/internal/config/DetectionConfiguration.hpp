#pragma once

#include "../calibration/ReferenceCalibrator.hpp"
#include "../detection/FrameScanner.hpp"
#include "../timeline/TimelineSegmenter.hpp"
#include <overlay_cut/interface/IConfiguration.hpp>
#include <opencv2/core.hpp>
#include <map>
#include <string>

namespace OverlayCut::Internal::Config {

class DetectionConfiguration : public Interface::IConfiguration {
  public:
    DetectionConfiguration();

    Types::Rgb getBackgroundColor() const override;
    void setBackgroundColor(const Types::Rgb& color) override;
    Types::HsvTriple getBackgroundTolerance() const override;
    void setBackgroundTolerance(const Types::HsvTriple& tolerance) override;

    Types::Rgb getAccentColor() const override;
    void setAccentColor(const Types::Rgb& color) override;
    Types::HsvTriple getAccentTolerance() const override;
    void setAccentTolerance(const Types::HsvTriple& tolerance) override;

    Types::HsvTriple getTextLower() const override;
    Types::HsvTriple getTextUpper() const override;
    void setTextRange(const Types::HsvTriple& lower, const Types::HsvTriple& upper) override;

    double getMinCalibrationAreaRatio() const override;
    void setMinCalibrationAreaRatio(double ratio) override;
    double getMinIoU() const override;
    void setMinIoU(double iou) override;
    double getMinAccentRatio() const override;
    void setMinAccentRatio(double ratio) override;
    double getMinTextRatio() const override;
    void setMinTextRatio(double ratio) override;

    Types::Seconds getClusterTolerance() const override;
    void setClusterTolerance(Types::Seconds tolerance) override;
    Types::Seconds getMinSegment() const override;
    void setMinSegment(Types::Seconds minSegment) override;

    int getProcessingWidth() const override;
    void setProcessingWidth(int width) override;
    int getFrameStep() const override;
    void setFrameStep(int step) override;
    int getProgressInterval() const override;
    void setProgressInterval(int frames) override;
    int getThreadCount() const override;
    void setThreadCount(int count) override;

    bool loadFromFile(const std::string& filename) override;
    bool saveToFile(const std::string& filename) const override;
    bool loadFromString(const std::string& configString) override;
    std::string saveToString() const override;

    // Throws std::invalid_argument for unknown keys or values that do not parse
    void setParameter(const std::string& key, const std::string& value) override;
    std::string getParameter(const std::string& key) const override;
    std::map<std::string, std::string> getAllParameters() const override;

    bool isValid() const override;
    void reset() override;
    void validate() override;

  private:
    Types::Rgb backgroundColor_;
    Types::HsvTriple backgroundTolerance_;
    Types::Rgb accentColor_;
    Types::HsvTriple accentTolerance_;
    Types::HsvTriple textLower_;
    Types::HsvTriple textUpper_;
    double minCalibrationAreaRatio_;
    double minIoU_;
    double minAccentRatio_;
    double minTextRatio_;
    Types::Seconds clusterTolerance_;
    Types::Seconds minSegment_;
    int processingWidth_;
    int frameStep_;
    int progressInterval_;
    int threadCount_;

    void write(cv::FileStorage& fs) const;
    void read(const cv::FileNode& root);
};

}  // namespace OverlayCut::Internal::Config

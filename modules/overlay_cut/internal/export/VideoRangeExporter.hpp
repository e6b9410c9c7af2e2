#pragma once

#include "../domain/TimeRange.hpp"
#include <overlay_cut/interface/ISegmentExporter.hpp>
#include <shared/types/Common.hpp>
#include <string>
#include <vector>

namespace OverlayCut::Internal::Export {

// Re-encodes only the frames that fall inside a keep range. Video stream only.
class VideoRangeExporter : public Interface::ISegmentExporter {
  public:
    struct ExportSettings {
        int fourcc;        // 0 = choose from the output extension
        double outputFps;  // <= 0 = keep the source rate

        ExportSettings();
    };

    explicit VideoRangeExporter(const ExportSettings& settings = ExportSettings{});

    Interface::ExportResult exportRanges(const std::string& sourcePath,
                                         const std::vector<Domain::KeepRange>& keepRanges,
                                         const std::string& outputPath) override;

    std::string getName() const override { return "VideoRangeExporter"; }

    // Index of the range containing timestamp (start inclusive, end exclusive), or -1.
    // Ranges must be sorted by start.
    static int findRange(const std::vector<Domain::KeepRange>& keepRanges, Types::Seconds timestamp);

    static int fourccForPath(const std::string& outputPath);

  private:
    ExportSettings settings_;
};

}  // namespace OverlayCut::Internal::Export

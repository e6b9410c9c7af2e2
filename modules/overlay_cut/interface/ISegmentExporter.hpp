#pragma once

#include <overlay_cut/internal/domain/TimeRange.hpp>
#include <string>
#include <vector>

namespace OverlayCut::Interface {

struct ExportResult {
    bool success = false;
    int segmentsWritten = 0;
    long framesWritten = 0;
    long framesSkipped = 0;
    float processingTimeMs = 0.0f;
    std::string outputPath;
    std::string errorMessage;
};

// Trims the keep ranges out of a source file and concatenates them into one output.
class ISegmentExporter {
  public:
    virtual ~ISegmentExporter() = default;

    virtual ExportResult exportRanges(const std::string& sourcePath,
                                      const std::vector<Domain::KeepRange>& keepRanges,
                                      const std::string& outputPath) = 0;

    virtual std::string getName() const = 0;
};

}  // namespace OverlayCut::Interface

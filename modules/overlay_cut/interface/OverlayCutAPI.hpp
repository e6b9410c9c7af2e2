#pragma once

// Main public API header - includes all interfaces
#include "IConfiguration.hpp"
#include "IFrameSource.hpp"
#include "ISegmentExporter.hpp"

#include <overlay_cut/internal/domain/DetectionEvent.hpp>
#include <overlay_cut/internal/domain/Errors.hpp>
#include <overlay_cut/internal/domain/Frame.hpp>
#include <overlay_cut/internal/domain/TimeRange.hpp>
#include <overlay_cut/internal/domain/VisionProfile.hpp>

// Common types for public API
#include <shared/types/Common.hpp>
#include <string>
#include <vector>

// Version information
namespace OverlayCut {

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

// Builds a profile from a reference screenshot with the default colors.
// Throws Domain::CalibrationError when no overlay panel is found.
Domain::VisionProfile calibrate(const Types::Image& referenceImage);

// Never throws for bad frames; they are reported as misses.
Domain::DetectionEvent scan(const Domain::Frame& frame, const Domain::VisionProfile& profile);

// Clusters the hit events and returns the footage to keep. Throws std::invalid_argument
// for a negative duration.
std::vector<Domain::KeepRange> segmentTimeline(const std::vector<Domain::DetectionEvent>& events,
                                               Types::Seconds duration);

// Simplified API for common use cases
namespace SimpleAPI {

// Reference image path + video path -> clean ranges. False on any failure.
bool findCleanRanges(const std::string& referenceImagePath, const std::string& videoPath,
                     std::vector<Domain::KeepRange>& keepRanges);

// ffmpeg arguments that cut keepRanges from inputPath into outputName
std::vector<std::string> buildEditCommand(const std::vector<Domain::KeepRange>& keepRanges,
                                          const std::string& outputName,
                                          const std::string& inputPath = "input.mp4");

// End to end: detect, then write the clean cut with the in-process exporter
bool removeOverlay(const std::string& referenceImagePath, const std::string& videoPath,
                   const std::string& outputVideoPath);

}  // namespace SimpleAPI

}  // namespace OverlayCut

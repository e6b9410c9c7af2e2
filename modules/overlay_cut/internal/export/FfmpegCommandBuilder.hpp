#pragma once

#include "../domain/TimeRange.hpp"
#include <string>
#include <vector>

namespace OverlayCut::Internal::Export {

/**
 * Builds ffmpeg arguments that cut the keep ranges out of one input and join them.
 *
 * Each range is trimmed from both the video and audio stream with its timestamps reset,
 * then all pieces go through a single concat filter. An empty range list yields a plain
 * transcode of the input.
 */
class FfmpegCommandBuilder {
  public:
    struct EncoderSettings {
        std::string inputName;
        std::string videoCodec;
        int crf;
        std::string preset;
        std::string audioCodec;

        EncoderSettings();
    };

    explicit FfmpegCommandBuilder(const EncoderSettings& settings = EncoderSettings{});

    // Arguments only, without the leading "ffmpeg"
    std::vector<std::string> build(const std::vector<Domain::KeepRange>& keepRanges,
                                   const std::string& outputName) const;

    std::string buildFilterGraph(const std::vector<Domain::KeepRange>& keepRanges) const;

    // "ffmpeg" followed by the arguments, single-quoted where the shell would split or expand them
    static std::string toCommandLine(const std::vector<std::string>& args);

    static std::string formatSeconds(Types::Seconds value);

    EncoderSettings getSettings() const { return settings_; }

  private:
    EncoderSettings settings_;

    static std::string quote(const std::string& arg);
};

}  // namespace OverlayCut::Internal::Export

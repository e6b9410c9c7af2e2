#include "FfmpegCommandBuilder.hpp"

#include <iomanip>
#include <sstream>

namespace OverlayCut::Internal::Export {

FfmpegCommandBuilder::EncoderSettings::EncoderSettings()
    : inputName("input.mp4"),
      videoCodec("libx264"),
      crf(18),
      preset("ultrafast"),
      audioCodec("aac") {}

FfmpegCommandBuilder::FfmpegCommandBuilder(const EncoderSettings& settings) : settings_(settings) {}

std::vector<std::string> FfmpegCommandBuilder::build(
    const std::vector<Domain::KeepRange>& keepRanges, const std::string& outputName) const {
    std::vector<std::string> args = {"-i", settings_.inputName};

    if (keepRanges.empty()) {
        args.push_back(outputName);
        return args;
    }

    args.insert(args.end(), {"-filter_complex", buildFilterGraph(keepRanges)});
    args.insert(args.end(), {"-map", "[outv]", "-map", "[outa]"});
    args.insert(args.end(), {"-c:v", settings_.videoCodec, "-crf", std::to_string(settings_.crf),
                             "-preset", settings_.preset});
    args.insert(args.end(), {"-c:a", settings_.audioCodec});
    args.push_back(outputName);
    return args;
}

std::string FfmpegCommandBuilder::buildFilterGraph(
    const std::vector<Domain::KeepRange>& keepRanges) const {
    std::ostringstream graph;
    std::ostringstream concatInputs;

    for (size_t i = 0; i < keepRanges.size(); ++i) {
        const std::string start = formatSeconds(keepRanges[i].start);
        const std::string end = formatSeconds(keepRanges[i].end);

        graph << "[0:v]trim=start=" << start << ":end=" << end << ",setpts=PTS-STARTPTS[v" << i
              << "];";
        graph << "[0:a]atrim=start=" << start << ":end=" << end << ",asetpts=PTS-STARTPTS[a" << i
              << "];";
        concatInputs << "[v" << i << "][a" << i << "]";
    }

    graph << concatInputs.str() << "concat=n=" << keepRanges.size() << ":v=1:a=1[outv][outa]";
    return graph.str();
}

std::string FfmpegCommandBuilder::toCommandLine(const std::vector<std::string>& args) {
    std::string line = "ffmpeg";
    for (const auto& arg : args) {
        line += ' ';
        line += quote(arg);
    }
    return line;
}

std::string FfmpegCommandBuilder::formatSeconds(Types::Seconds value) {
    // Shortest form: 2 -> "2", 1.5 -> "1.5"
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    return oss.str();
}

std::string FfmpegCommandBuilder::quote(const std::string& arg) {
    if (arg.empty()) return "''";

    const bool plain = arg.find_first_not_of(
                           "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789-_.,/:=+@%") ==
                       std::string::npos;
    if (plain) return arg;

    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

}  // namespace OverlayCut::Internal::Export

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <overlay_cut/interface/OverlayCutAPI.hpp>
#include <overlay_cut/internal/export/FfmpegCommandBuilder.hpp>
#include <overlay_cut/internal/export/VideoRangeExporter.hpp>
#include <overlay_cut/internal/io/VideoFrameSource.hpp>
#include <overlay_cut/internal/session/ScanSession.hpp>
#include <shared/utils/Logger.hpp>

using namespace OverlayCut;

struct AppSettings {
    std::string referencePath;
    std::string videoPath;
    std::string reportPath = "overlay_cut_report.yml";
    std::string configPath;
    std::string exportPath;
    int frameStep = 0;        // 0 = from configuration
    int processingWidth = -1; // -1 = from configuration
    int threads = -1;         // -1 = from configuration
    bool debug = false;
    bool verbose = false;
};

void printUsage(const char* programName) {
    std::cout << "Overlay Cut - finds and removes menu overlay footage\n";
    std::cout << "Usage: " << programName << " [options] <reference_image> <video>\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  reference_image         Screenshot showing the overlay menu\n";
    std::cout << "  video                   Video to scan\n\n";
    std::cout << "Options:\n";
    std::cout << "  -o, --output <file>     Report file, .yml/.xml/.json (default: overlay_cut_report.yml)\n";
    std::cout << "  -c, --config <file>     Detection configuration file\n";
    std::cout << "  --export <file>         Also write the clean cut (video only) to <file>\n";
    std::cout << "  --every <n>             Scan every Nth frame (default: 1)\n";
    std::cout << "  --width <px>            Processing width, 0 keeps full size (default: 640)\n";
    std::cout << "  --threads <n>           Scanner threads, 0 = auto (default: 1)\n";
    std::cout << "  --debug                 Log spatial matches and triad densities\n";
    std::cout << "  -v, --verbose           Enable verbose output\n";
    std::cout << "  -h, --help              Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " menu.png gameplay.mp4\n";
    std::cout << "  " << programName << " --every 2 --threads 0 --export clean.mp4 menu.png gameplay.mp4\n";
}

std::string requireValue(int argc, char* argv[], int& i) {
    if (i + 1 >= argc) {
        std::cerr << "Error: " << argv[i] << " requires a value\n";
        exit(1);
    }
    return argv[++i];
}

AppSettings parseArguments(int argc, char* argv[]) {
    AppSettings settings;
    std::vector<std::string> positionalArgs;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            exit(0);
        } else if (arg == "-o" || arg == "--output") {
            settings.reportPath = requireValue(argc, argv, i);
        } else if (arg == "-c" || arg == "--config") {
            settings.configPath = requireValue(argc, argv, i);
        } else if (arg == "--export") {
            settings.exportPath = requireValue(argc, argv, i);
        } else if (arg == "--every") {
            settings.frameStep = std::stoi(requireValue(argc, argv, i));
            if (settings.frameStep < 1) {
                std::cerr << "Error: --every must be at least 1\n";
                exit(1);
            }
        } else if (arg == "--width") {
            settings.processingWidth = std::stoi(requireValue(argc, argv, i));
        } else if (arg == "--threads") {
            settings.threads = std::stoi(requireValue(argc, argv, i));
        } else if (arg == "--debug") {
            settings.debug = true;
        } else if (arg == "-v" || arg == "--verbose") {
            settings.verbose = true;
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << "\n";
            exit(1);
        } else {
            positionalArgs.push_back(arg);
        }
    }

    if (positionalArgs.size() != 2) {
        std::cerr << "Error: expected <reference_image> <video>\n\n";
        printUsage(argv[0]);
        exit(1);
    }
    settings.referencePath = positionalArgs[0];
    settings.videoPath = positionalArgs[1];
    return settings;
}

bool writeReport(const std::string& path, const AppSettings& settings,
                 const Internal::Session::ScanSession::Result& result,
                 const std::vector<std::string>& ffmpegArgs) {
    cv::FileStorage fs(path, cv::FileStorage::WRITE);
    if (!fs.isOpened()) {
        std::cerr << "Error: Cannot write report " << path << "\n";
        return false;
    }

    fs << "reference" << settings.referencePath;
    fs << "video" << settings.videoPath;
    fs << "duration" << result.duration;
    fs << "frames_scanned" << static_cast<int>(result.framesScanned);
    fs << "frames_with_overlay" << static_cast<int>(result.framesWithHits);
    fs << "faulted_frames" << static_cast<int>(result.faultedFrames);

    fs << "detections" << "[";
    for (const auto& range : result.segmentation.detections) {
        fs << "{" << "start" << range.start << "end" << range.end
           << "confidence" << range.confidence << "}";
    }
    fs << "]";

    fs << "keep_ranges" << "[";
    for (const auto& range : result.segmentation.keepRanges) {
        fs << "{" << "start" << range.start << "end" << range.end << "}";
    }
    fs << "]";

    fs << "ffmpeg_args" << "[";
    for (const auto& arg : ffmpegArgs) {
        fs << arg;
    }
    fs << "]";

    fs.release();
    return true;
}

int main(int argc, char* argv[]) {
    try {
        AppSettings settings = parseArguments(argc, argv);

        // Configure logging
        if (settings.verbose || settings.debug) {
            Shared::Logger::getInstance().setLevel(Shared::LogLevel::DEBUG);
        } else {
            Shared::Logger::getInstance().setLevel(Shared::LogLevel::INFO);
        }

        std::unique_ptr<Interface::IConfiguration> config = Interface::createDefaultConfiguration();
        if (!settings.configPath.empty() && !config->loadFromFile(settings.configPath)) {
            std::cerr << "Error: Cannot load configuration " << settings.configPath << "\n";
            return 1;
        }
        if (settings.frameStep > 0) config->setFrameStep(settings.frameStep);
        if (settings.processingWidth >= 0) config->setProcessingWidth(settings.processingWidth);
        if (settings.threads >= 0) config->setThreadCount(settings.threads);
        config->validate();

        std::cerr << "Overlay Cut " << VERSION_STRING << "\n";
        std::cerr << "Reference: " << settings.referencePath << "\n";
        std::cerr << "Video: " << settings.videoPath << "\n";
        std::cerr << "Report: " << settings.reportPath << "\n\n";

        const Types::Image reference = cv::imread(settings.referencePath, cv::IMREAD_COLOR);
        if (reference.empty()) {
            std::cerr << "Error: Cannot load reference image " << settings.referencePath << "\n";
            return 1;
        }

        Internal::IO::VideoFrameSource::SourceSettings sourceSettings;
        sourceSettings.processingWidth = config->getProcessingWidth();
        sourceSettings.frameStep = config->getFrameStep();
        Internal::IO::VideoFrameSource source(settings.videoPath, sourceSettings);

        auto sessionSettings = Internal::Session::ScanSession::SessionSettings::fromConfiguration(*config);
        sessionSettings.scanner.debug = settings.debug;

        Internal::Session::ScanSession session(sessionSettings);
        session.setProgressCallback([](long frames, float percentage, Types::Seconds timestamp) {
            std::cerr << "\rScanned " << frames << " frames (" << static_cast<int>(percentage)
                      << "%, " << timestamp << "s)" << std::flush;
        });

        Internal::Session::ScanSession::Result result;
        try {
            result = session.run(reference, source);
        } catch (const Domain::CalibrationError& e) {
            std::cerr << "\nCalibration failed: " << e.what() << "\n";
            return 2;
        }
        std::cerr << "\n" << result.getSummary() << "\n";

        if (!result.isSuccess()) {
            std::cerr << "Scan failed. See error messages above.\n";
            return 1;
        }

        const std::string outputName =
            settings.exportPath.empty() ? std::string("output.mp4") : settings.exportPath;
        const std::vector<std::string> ffmpegArgs =
            SimpleAPI::buildEditCommand(result.segmentation.keepRanges, outputName, settings.videoPath);

        for (const auto& range : result.segmentation.keepRanges) {
            std::cout << "keep " << range.start << " " << range.end << "\n";
        }
        std::cout << Internal::Export::FfmpegCommandBuilder::toCommandLine(ffmpegArgs) << "\n";

        if (!writeReport(settings.reportPath, settings, result, ffmpegArgs)) {
            return 1;
        }

        if (!settings.exportPath.empty()) {
            Internal::Export::VideoRangeExporter exporter;
            const Interface::ExportResult exported =
                exporter.exportRanges(settings.videoPath, result.segmentation.keepRanges,
                                      settings.exportPath);
            if (!exported.success) {
                std::cerr << "Export failed: " << exported.errorMessage << "\n";
                return 1;
            }
            std::cerr << "Exported " << exported.framesWritten << " frames in "
                      << exported.segmentsWritten << " segments to " << exported.outputPath << "\n";
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

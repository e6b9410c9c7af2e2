#include <overlay_cut/internal/export/FfmpegCommandBuilder.hpp>
#include <overlay_cut/internal/export/VideoRangeExporter.hpp>
#include <overlay_cut/internal/io/VideoFrameSource.hpp>
#include <overlay_cut/interface/OverlayCutAPI.hpp>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace OverlayCut;
using Internal::Export::FfmpegCommandBuilder;
using Internal::Export::VideoRangeExporter;

namespace {

void require(bool condition, const char *message)
{
	if (condition)
		return;
	std::cerr << "Export test failed: " << message << std::endl;
	std::exit(1);
}

void test_empty_ranges_transcode()
{
	const FfmpegCommandBuilder builder;
	const std::vector<std::string> args = builder.build({}, "output.mp4");
	require(args == std::vector<std::string>({"-i", "input.mp4", "output.mp4"}), "no ranges is a plain transcode");
}

void test_single_range_command()
{
	const FfmpegCommandBuilder builder;
	const std::vector<std::string> args = builder.build({{0.0, 2.5}}, "clean.mp4");

	const std::vector<std::string> expected = {
		"-i", "input.mp4", "-filter_complex",
		"[0:v]trim=start=0:end=2.5,setpts=PTS-STARTPTS[v0];"
		"[0:a]atrim=start=0:end=2.5,asetpts=PTS-STARTPTS[a0];"
		"[v0][a0]concat=n=1:v=1:a=1[outv][outa]",
		"-map", "[outv]", "-map", "[outa]",
		"-c:v", "libx264", "-crf", "18", "-preset", "ultrafast",
		"-c:a", "aac", "clean.mp4"};
	require(args == expected, "single range trims video and audio and concatenates");
}

void test_multiple_ranges_filter_graph()
{
	const FfmpegCommandBuilder builder;
	const std::string graph = builder.buildFilterGraph({{0.0, 3.0}, {5.0, 10.0}, {12.25, 20.0}});

	require(graph.find("[0:v]trim=start=5:end=10,setpts=PTS-STARTPTS[v1];") != std::string::npos,
		"second video segment is labeled v1");
	require(graph.find("[0:a]atrim=start=12.25:end=20,asetpts=PTS-STARTPTS[a2];") != std::string::npos,
		"third audio segment is labeled a2");
	require(graph.find("[v0][a0][v1][a1][v2][a2]concat=n=3:v=1:a=1[outv][outa]") != std::string::npos,
		"concat interleaves video and audio labels");
}

void test_number_formatting()
{
	require(FfmpegCommandBuilder::formatSeconds(2.0) == "2", "whole seconds print without decimals");
	require(FfmpegCommandBuilder::formatSeconds(1.5) == "1.5", "fractions keep their digits");
	require(FfmpegCommandBuilder::formatSeconds(0.1 + 0.2) == "0.3", "rounding noise is hidden");
	require(FfmpegCommandBuilder::formatSeconds(123.456) == "123.456", "long timestamps are exact");
}

void test_custom_encoder_settings()
{
	FfmpegCommandBuilder::EncoderSettings settings;
	settings.inputName = "source.mov";
	settings.crf = 23;
	settings.preset = "medium";
	const FfmpegCommandBuilder builder(settings);

	const std::vector<std::string> args = builder.build({{1.0, 2.0}}, "out.mp4");
	require(args[1] == "source.mov", "input name is configurable");
	bool sawCrf = false;
	bool sawPreset = false;
	for (size_t i = 0; i + 1 < args.size(); ++i) {
		if (args[i] == "-crf")
			sawCrf = args[i + 1] == "23";
		if (args[i] == "-preset")
			sawPreset = args[i + 1] == "medium";
	}
	require(sawCrf && sawPreset, "encoder quality settings are applied");
}

void test_command_line_quoting()
{
	const std::string line = FfmpegCommandBuilder::toCommandLine({"-i", "my clip.mp4", "-map", "[outv]", "it's.mp4"});
	require(line == "ffmpeg -i 'my clip.mp4' -map '[outv]' 'it'\\''s.mp4'", "shell-sensitive arguments are quoted");

	const std::string plain = FfmpegCommandBuilder::toCommandLine({"-c:v", "libx264", "out.mp4"});
	require(plain == "ffmpeg -c:v libx264 out.mp4", "plain arguments are left alone");

	require(FfmpegCommandBuilder::toCommandLine({""}) == "ffmpeg ''", "empty argument stays visible");
}

void test_api_build_edit_command()
{
	const std::vector<std::string> args = SimpleAPI::buildEditCommand({{0.0, 3.0}, {5.0, 10.0}}, "o.mp4");
	require(args.size() == 17, "API returns the full argument list");
	require(args.back() == "o.mp4", "output name comes last");
	require(args[1] == "input.mp4", "input defaults to a placeholder name");

	const std::vector<std::string> scanned =
		SimpleAPI::buildEditCommand({{0.0, 3.0}}, "clean.mp4", "/videos/my game.mkv");
	require(scanned[0] == "-i" && scanned[1] == "/videos/my game.mkv", "command reads the scanned video");
	require(FfmpegCommandBuilder::toCommandLine(scanned).find("-i '/videos/my game.mkv'") != std::string::npos,
		"scanned path is quoted on the command line");
}

void test_find_range()
{
	const std::vector<Domain::KeepRange> ranges = {{0.0, 3.0}, {5.0, 10.0}};
	require(VideoRangeExporter::findRange(ranges, 0.0) == 0, "range start is inclusive");
	require(VideoRangeExporter::findRange(ranges, 2.999) == 0, "inside the first range");
	require(VideoRangeExporter::findRange(ranges, 3.0) == -1, "range end is exclusive");
	require(VideoRangeExporter::findRange(ranges, 4.0) == -1, "gap between ranges is skipped");
	require(VideoRangeExporter::findRange(ranges, 5.0) == 1, "second range start is inclusive");
	require(VideoRangeExporter::findRange(ranges, 10.0) == -1, "past the last range");
	require(VideoRangeExporter::findRange({}, 1.0) == -1, "no ranges match nothing");
}

void test_codec_choice()
{
	require(VideoRangeExporter::fourccForPath("clean.mp4") == cv::VideoWriter::fourcc('m', 'p', '4', 'v'),
		"mp4 uses MPEG-4");
	require(VideoRangeExporter::fourccForPath("CLEAN.AVI") == cv::VideoWriter::fourcc('M', 'J', 'P', 'G'),
		"avi uses Motion JPEG regardless of case");
}

// 20 frames at 10 fps, each frame filled with its own index
void writeNumberedClip(const std::string &path)
{
	cv::VideoWriter writer(path, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'), 10.0, cv::Size(64, 48), true);
	require(writer.isOpened(), "synthetic clip can be written");
	for (int i = 0; i < 20; ++i)
		writer.write(cv::Mat(48, 64, CV_8UC3, cv::Scalar(i * 10, 128, 255 - i * 10)));
}

long countFrames(const std::string &path)
{
	cv::VideoCapture capture(path);
	long count = 0;
	cv::Mat frame;
	while (capture.read(frame))
		++count;
	return count;
}

void test_export_writes_keep_ranges()
{
	const std::string sourcePath = "overlay_cut_export_source.avi";
	const std::string outputPath = "overlay_cut_export_clean.avi";
	writeNumberedClip(sourcePath);

	// Bounds sit between frames so either frame timestamp convention selects the same frames
	VideoRangeExporter exporter;
	const Interface::ExportResult result =
		exporter.exportRanges(sourcePath, {{1.05, 1.45}, {0.05, 0.55}, {0.8, 0.8}}, outputPath);
	require(result.success, "export succeeds");
	require(result.outputPath == outputPath, "result names the output");
	require(result.segmentsWritten == 2, "both valid ranges are written");
	require(result.framesWritten == 9, "five frames from the first range and four from the second");
	require(countFrames(outputPath) == 9, "output holds only the kept frames");
	require(result.framesSkipped <= 6, "decoding stops after the last range");

	std::remove(sourcePath.c_str());
	std::remove(outputPath.c_str());
}

void test_missing_source()
{
	VideoRangeExporter exporter;
	const Interface::ExportResult result =
		exporter.exportRanges("no_such_video.mp4", {{0.0, 1.0}}, "never_written.avi");
	require(!result.success, "missing source fails");
	require(!result.errorMessage.empty(), "failure carries a message");
	require(result.framesWritten == 0, "nothing is written");
	require(exporter.getName() == "VideoRangeExporter", "exporter names itself");

	bool threw = false;
	try {
		Internal::IO::VideoFrameSource source("no_such_video.mp4");
	} catch (const std::runtime_error &) {
		threw = true;
	}
	require(threw, "frame source rejects a missing file");

	std::vector<Domain::KeepRange> keep;
	require(!SimpleAPI::findCleanRanges("no_such_image.png", "no_such_video.mp4", keep),
		"API reports missing inputs");
}

} // namespace

int main()
{
	test_empty_ranges_transcode();
	test_single_range_command();
	test_multiple_ranges_filter_graph();
	test_number_formatting();
	test_custom_encoder_settings();
	test_command_line_quoting();
	test_api_build_edit_command();
	test_find_range();
	test_codec_choice();
	test_export_writes_keep_ranges();
	test_missing_source();
	return 0;
}

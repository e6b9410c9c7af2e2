#include <overlay_cut/internal/config/DetectionConfiguration.hpp>
#include <overlay_cut/internal/io/MemoryFrameSource.hpp>
#include <overlay_cut/internal/session/ScanSession.hpp>

#include "test-frames.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace OverlayCut;
using Internal::IO::MemoryFrameSource;
using Internal::Session::ScanSession;

namespace {

void require(bool condition, const char *message)
{
	if (condition)
		return;
	std::cerr << "Session test failed: " << message << std::endl;
	std::exit(1);
}

// 10 s at 10 fps; the menu is up from 3.0 s through 5.0 s
MemoryFrameSource makeClip(double reportedDuration = 10.0)
{
	const cv::Mat menu = test_frames::makeReference();
	const cv::Mat scene = test_frames::makeScene(test_frames::referenceSize());

	MemoryFrameSource source(reportedDuration, "clip");
	for (int i = 0; i < 100; ++i) {
		const bool showing = i >= 30 && i <= 50;
		source.addFrame(showing ? menu : scene, i / 10.0);
	}
	return source;
}

// Cancels the session as soon as the scan first asks for the clip length
class CancellingSource : public Interface::IFrameSource {
public:
	CancellingSource(MemoryFrameSource &inner, ScanSession &session) : inner_(inner), session_(session)
	{
	}

	bool next(Domain::Frame &frame) override
	{
		++pulled;
		return inner_.next(frame);
	}

	Types::Seconds getDurationSeconds() const override
	{
		session_.cancel();
		return inner_.getDurationSeconds();
	}

	std::string getName() const override { return "cancelling " + inner_.getName(); }

	int pulled = 0;

private:
	MemoryFrameSource &inner_;
	ScanSession &session_;
};

void requireMenuRemoved(const ScanSession::Result &result)
{
	require(result.isSuccess(), "session completes");
	require(result.status == Types::SessionStatus::COMPLETED, "status is completed");
	require(result.framesScanned == 100, "every frame is scanned");
	require(result.framesWithHits == 21, "menu frames are counted");
	require(result.faultedFrames == 0, "no frame faults");

	const auto &segmentation = result.segmentation;
	require(segmentation.detections.size() == 1, "one overlay range");
	require(segmentation.detections[0].start == 3.0 && segmentation.detections[0].end == 5.0,
		"overlay range spans the menu frames");
	require(segmentation.keepRanges.size() == 2, "two clean segments");
	require(segmentation.keepRanges[0].start == 0.0 && segmentation.keepRanges[0].end == 3.0,
		"first segment ends where the menu opens");
	require(segmentation.keepRanges[1].start == 5.0 && segmentation.keepRanges[1].end == 10.0,
		"second segment starts where the menu closes");
}

void test_sequential_run()
{
	MemoryFrameSource source = makeClip();
	ScanSession session;
	require(session.getStatus() == Types::SessionStatus::IDLE, "new session is idle");

	const auto result = session.run(test_frames::makeReference(), source);
	requireMenuRemoved(result);
	require(session.getStatus() == Types::SessionStatus::COMPLETED, "session reports completion");
	require(!session.isRunning(), "session is no longer running");
	require(result.duration == 10.0, "duration comes from the source");
	require(!result.getSummary().empty(), "summary is available");
}

void test_parallel_run_matches_sequential()
{
	MemoryFrameSource source = makeClip();
	ScanSession::SessionSettings settings;
	settings.numThreads = 4;
	ScanSession session(settings);

	requireMenuRemoved(session.run(test_frames::makeReference(), source));
}

void test_run_with_existing_profile()
{
	ScanSession session;
	const Domain::VisionProfile profile = session.calibrate(test_frames::makeReference());

	MemoryFrameSource first = makeClip();
	requireMenuRemoved(session.run(profile, first));

	// The profile is reusable across runs
	MemoryFrameSource second = makeClip();
	requireMenuRemoved(session.run(profile, second));
}

void test_calibration_failure_stops_before_scanning()
{
	MemoryFrameSource source = makeClip();
	ScanSession session;

	bool threw = false;
	try {
		session.run(test_frames::makeScene(test_frames::referenceSize()), source);
	} catch (const Domain::CalibrationError &) {
		threw = true;
	}
	require(threw, "calibration error reaches the caller");
	require(session.getStatus() == Types::SessionStatus::FAILED, "session is marked failed");

	Domain::Frame frame;
	require(source.next(frame) && frame.index == 0, "no frame was consumed");
}

void test_cancel_discards_hits()
{
	MemoryFrameSource source = makeClip();
	ScanSession::SessionSettings settings;
	settings.progressInterval = 40;
	ScanSession session(settings);

	session.setProgressCallback([&session](long, float, Types::Seconds) { session.cancel(); });

	const auto result = session.run(test_frames::makeReference(), source);
	require(result.status == Types::SessionStatus::ABORTED, "cancelled run is aborted");
	require(!result.isSuccess(), "aborted run is not a success");
	require(result.framesScanned == 40, "scanning stops at the next frame boundary");
	require(result.framesWithHits == 10, "hits seen before cancelling are counted");
	require(result.segmentation.detections.empty(), "partial hits are not clustered");
	require(result.segmentation.keepRanges.empty(), "no keep ranges after abort");
	require(session.isCancelled(), "session reports cancellation");
	require(session.getStatus() == Types::SessionStatus::ABORTED, "session status is aborted");
}

void test_cancel_before_first_frame()
{
	for (const int threads : {1, 4}) {
		MemoryFrameSource clip = makeClip();
		ScanSession::SessionSettings settings;
		settings.numThreads = threads;
		ScanSession session(settings);
		CancellingSource source(clip, session);

		const auto result = session.run(test_frames::makeReference(), source);
		require(result.status == Types::SessionStatus::ABORTED, "cancel after calibration aborts the run");
		require(result.framesScanned == 0, "no frame is scanned after an early cancel");
		require(source.pulled == 0, "no frame is pulled after an early cancel");
		require(result.segmentation.keepRanges.empty(), "early cancel yields no keep ranges");
	}

	// A fresh run starts uncancelled
	MemoryFrameSource clip = makeClip();
	ScanSession session;
	session.cancel();
	requireMenuRemoved(session.run(test_frames::makeReference(), clip));
}

void test_faulted_frames_do_not_stop_the_scan()
{
	MemoryFrameSource source(3.0, "faulty");
	const cv::Mat menu = test_frames::makeReference();
	source.addFrame(menu, 0.0);
	source.addFrame(cv::Mat(), 0.5);
	source.addFrame(cv::Mat(360, 640, CV_8UC2, cv::Scalar(0, 0)), 1.0);
	source.addFrame(menu, 1.5);
	source.addFrame(test_frames::makeScene(test_frames::referenceSize()), 2.5);

	ScanSession session;
	const auto result = session.run(menu, source);
	require(result.isSuccess(), "session survives malformed frames");
	require(result.framesScanned == 5, "malformed frames are still counted as scanned");
	require(result.faultedFrames == 2, "malformed frames are counted as faults");
	require(result.framesWithHits == 2, "good frames are still detected");
	require(result.segmentation.detections.size() == 2, "faulted frames read as misses between hits");
}

void test_duration_falls_back_to_last_timestamp()
{
	MemoryFrameSource source = makeClip(0.0);
	ScanSession session;
	const auto result = session.run(test_frames::makeReference(), source);
	require(result.isSuccess(), "session completes without a known duration");
	require(std::fabs(result.duration - 9.9) < 1e-9, "duration is the last frame timestamp");
	require(result.segmentation.keepRanges.size() == 2, "clean segments are still produced");
}

void test_progress_reports()
{
	MemoryFrameSource source = makeClip();
	ScanSession::SessionSettings settings;
	settings.progressInterval = 25;
	ScanSession session(settings);

	std::vector<long> frames;
	std::vector<float> percentages;
	session.setProgressCallback([&](long scanned, float percentage, Types::Seconds) {
		frames.push_back(scanned);
		percentages.push_back(percentage);
	});

	require(session.run(test_frames::makeReference(), source).isSuccess(), "session completes");
	require(frames == std::vector<long>({25, 50, 75, 100}), "progress is throttled to the interval");
	for (size_t i = 0; i < percentages.size(); ++i) {
		require(percentages[i] >= 0.0f && percentages[i] <= 100.0f, "percentage is bounded");
		if (i > 0)
			require(percentages[i] >= percentages[i - 1], "percentage never decreases");
	}
}

void test_settings_from_configuration()
{
	Internal::Config::DetectionConfiguration config;
	config.setMinIoU(0.5);
	config.setClusterTolerance(1.0);
	config.setMinSegment(0.25);
	config.setThreadCount(3);
	config.setProgressInterval(12);
	config.setAccentColor({200, 10, 10});

	const auto settings = ScanSession::SessionSettings::fromConfiguration(config);
	require(settings.scanner.minIoU == 0.5, "IoU threshold is mapped");
	require(settings.timeline.clusterTolerance == 1.0, "cluster tolerance is mapped");
	require(settings.timeline.minSegment == 0.25, "minimum segment is mapped");
	require(settings.numThreads == 3, "thread count is mapped");
	require(settings.progressInterval == 12, "progress interval is mapped");
	require(settings.calibration.accentColor.r == 200, "accent color is mapped");
	require(settings.calibration.minAreaRatio == 0.01, "untouched values keep their defaults");
}

} // namespace

int main()
{
	test_sequential_run();
	test_parallel_run_matches_sequential();
	test_run_with_existing_profile();
	test_calibration_failure_stops_before_scanning();
	test_cancel_discards_hits();
	test_cancel_before_first_frame();
	test_faulted_frames_do_not_stop_the_scan();
	test_duration_falls_back_to_last_timestamp();
	test_progress_reports();
	test_settings_from_configuration();
	return 0;
}

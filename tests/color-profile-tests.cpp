#include <overlay_cut/internal/domain/ColorRange.hpp>
#include <overlay_cut/internal/domain/SpatialTemplate.hpp>
#include <overlay_cut/internal/domain/VisionProfile.hpp>
#include <overlay_cut/internal/processing/ColorSegmenter.hpp>
#include <overlay_cut/internal/processing/ColorSpaceConverter.hpp>

#include "test-frames.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>

using namespace OverlayCut;
using Internal::Processing::ColorSegmenter;
using Internal::Processing::ColorSpaceConverter;

namespace {

void require(bool condition, const char *message)
{
	if (condition)
		return;
	std::cerr << "Color profile test failed: " << message << std::endl;
	std::exit(1);
}

bool near(double a, double b, double eps = 1e-6)
{
	return std::fabs(a - b) <= eps;
}

void test_rgb_to_hsv_primaries()
{
	const Types::HsvTriple red = ColorSpaceConverter::rgbToHsv({255, 0, 0});
	require(near(red[0], 0.0) && near(red[1], 255.0) && near(red[2], 255.0), "red maps to H0 S255 V255");

	const Types::HsvTriple green = ColorSpaceConverter::rgbToHsv({0, 255, 0});
	require(near(green[0], 60.0), "green hue is halved to 60");

	const Types::HsvTriple blue = ColorSpaceConverter::rgbToHsv({0, 0, 255});
	require(near(blue[0], 120.0), "blue hue is halved to 120");

	const Types::HsvTriple white = ColorSpaceConverter::rgbToHsv({255, 255, 255});
	require(near(white[1], 0.0) && near(white[2], 255.0), "white has no saturation and full value");

	const Types::HsvTriple black = ColorSpaceConverter::rgbToHsv({0, 0, 0});
	require(near(black[0], 0.0) && near(black[1], 0.0) && near(black[2], 0.0), "black is all zeros");

	// Red with a little blue wraps around to the top of the hue circle
	const Types::HsvTriple magentaRed = ColorSpaceConverter::rgbToHsv({255, 0, 51});
	require(magentaRed[0] > 170.0 && magentaRed[0] <= 180.0, "negative hue wraps into range");
}

void test_rgb_to_hsv_matches_opencv()
{
	const Types::Rgb colors[] = {{14, 4, 49}, {50, 4, 139}, {200, 120, 30}, {12, 200, 90}};
	for (const auto &rgb : colors) {
		cv::Mat pixel(1, 1, CV_8UC3, cv::Scalar(rgb.b, rgb.g, rgb.r));
		const cv::Mat hsv = ColorSpaceConverter::toHsv(pixel);
		const cv::Vec3b actual = hsv.at<cv::Vec3b>(0, 0);
		const Types::HsvTriple expected = ColorSpaceConverter::rgbToHsv(rgb);
		require(std::fabs(actual[0] - expected[0]) <= 1.0, "hue agrees with cvtColor");
		require(std::fabs(actual[1] - expected[1]) <= 1.0, "saturation agrees with cvtColor");
		require(std::fabs(actual[2] - expected[2]) <= 1.0, "value agrees with cvtColor");
	}
}

void test_range_from_color_stays_in_domain()
{
	for (int r = 0; r <= 255; r += 51) {
		for (int g = 0; g <= 255; g += 51) {
			for (int b = 0; b <= 255; b += 51) {
				const Types::Rgb rgb{static_cast<std::uint8_t>(r), static_cast<std::uint8_t>(g),
						     static_cast<std::uint8_t>(b)};
				const Domain::ColorRange range = ColorSpaceConverter::rangeFromColor(rgb, 20, 50, 50);
				require(range.isValid(), "range is ordered and inside the HSV domain");
				require(range.lower[0] <= range.upper[0], "lower hue does not exceed upper hue");
				require(range.contains(ColorSpaceConverter::rgbToHsv(rgb)), "range contains its center");
			}
		}
	}
}

void test_range_clamps_at_edges()
{
	const Domain::ColorRange red = ColorSpaceConverter::rangeFromColor({255, 0, 0}, 20, 50, 50);
	require(near(red.lower[0], 0.0), "hue lower bound clamps to 0");
	require(near(red.upper[0], 20.0), "hue upper bound widens by tolerance");
	require(near(red.upper[1], 255.0) && near(red.upper[2], 255.0), "saturation and value clamp to 255");
	require(near(red.lower[1], 205.0), "saturation lower bound widens by tolerance");
}

void test_default_palette_separation()
{
	const Domain::ColorRange background = ColorSpaceConverter::rangeFromColor({14, 4, 49}, 20, 50, 50);
	const Domain::ColorRange accent = ColorSpaceConverter::rangeFromColor({50, 4, 139}, 15, 50, 50);
	const Domain::ColorRange text = Domain::ColorRange::fromBounds({0, 0, 200}, {180, 30, 255});

	cv::Mat frame = test_frames::makeReference();
	const cv::Mat hsv = ColorSpaceConverter::toHsv(frame);

	const cv::Mat panelRoi = hsv(test_frames::referencePanel());
	const cv::Rect accentBar = test_frames::accentBarFor(test_frames::referencePanel());
	const cv::Rect textLine = test_frames::textLineFor(test_frames::referencePanel());

	const double panelArea = 240.0 * 160.0;
	require(near(ColorSegmenter::matchRatio(panelRoi, accent), accentBar.area() / panelArea),
		"accent ratio counts only the selection bar");
	require(near(ColorSegmenter::matchRatio(panelRoi, text), textLine.area() / panelArea),
		"text ratio counts only the text line");

	const cv::Mat sceneRoi = hsv(cv::Rect(0, 0, 100, 50));
	require(ColorSegmenter::matchRatio(sceneRoi, background) == 0.0, "gray scene is not background");
}

void test_segment_finds_panel_as_one_region()
{
	const cv::Mat hsv = ColorSpaceConverter::toHsv(test_frames::makeReference());
	const Domain::ColorRange background = ColorSpaceConverter::rangeFromColor({14, 4, 49}, 20, 50, 50);

	const auto blobs = ColorSegmenter::segment(hsv, background);
	require(blobs.size() == 1, "holes left by bar and text do not split the panel");
	require(blobs[0].boundingBox == test_frames::referencePanel(), "bounding box is the panel");
	require(blobs[0].area > 0.01 * 640 * 360, "panel area is above the calibration threshold");
}

void test_to_hsv_rejects_unsupported_layouts()
{
	bool threw = false;
	try {
		ColorSpaceConverter::toHsv(cv::Mat(10, 10, CV_8UC2, cv::Scalar(0, 0)));
	} catch (const Domain::FrameScanError &) {
		threw = true;
	}
	require(threw, "two-channel input is a frame scan error");

	threw = false;
	try {
		ColorSpaceConverter::toHsv(cv::Mat(10, 10, CV_32FC3, cv::Scalar(0, 0, 0)));
	} catch (const Domain::FrameScanError &) {
		threw = true;
	}
	require(threw, "float input is a frame scan error");

	const cv::Mat gray(10, 10, CV_8UC1, cv::Scalar(200));
	require(ColorSpaceConverter::toHsv(gray).type() == CV_8UC3, "grayscale input is expanded");

	const cv::Mat bgra(10, 10, CV_8UC4, cv::Scalar(49, 4, 14, 255));
	require(ColorSpaceConverter::toHsv(bgra).type() == CV_8UC3, "alpha channel is dropped");
}

void test_spatial_template_normalization()
{
	const Domain::SpatialTemplate spatial =
		Domain::SpatialTemplate::fromPixelBox(cv::Rect(100, 50, 200, 100), cv::Size(400, 200));
	require(near(spatial.x, 0.25) && near(spatial.y, 0.25), "origin is normalized");
	require(near(spatial.width, 0.5) && near(spatial.height, 0.5), "size is normalized");
	require(near(spatial.aspectRatio, 2.0), "aspect ratio uses pixel dimensions");
	require(spatial.isValid(), "normalized box lies inside the frame");

	require(spatial.project(cv::Size(800, 400)) == cv::Rect(200, 100, 400, 200), "projects to a larger frame");
	require(spatial.project(cv::Size(400, 200)) == cv::Rect(100, 50, 200, 100), "projects back to the source");

	const Domain::SpatialTemplate degenerate =
		Domain::SpatialTemplate::fromPixelBox(cv::Rect(0, 0, 10, 10), cv::Size(0, 0));
	require(!degenerate.isValid(), "empty image yields an invalid template");
}

void test_profile_is_a_value()
{
	const Domain::ColorRange background = ColorSpaceConverter::rangeFromColor({14, 4, 49}, 20, 50, 50);
	const Domain::ColorRange accent = ColorSpaceConverter::rangeFromColor({50, 4, 139}, 15, 50, 50);
	const Domain::ColorRange text = Domain::ColorRange::fromBounds({0, 0, 200}, {180, 30, 255});
	const Domain::SpatialTemplate spatial =
		Domain::SpatialTemplate::fromPixelBox(cv::Rect(100, 50, 200, 100), cv::Size(400, 200));

	const Domain::VisionProfile profile(background, accent, text, spatial);
	const Domain::VisionProfile copy = profile;
	require(copy.isValid(), "copied profile is valid");
	require(copy.getBackground().lower == profile.getBackground().lower, "copy keeps background bounds");
	require(!profile.describe().empty(), "profile has a description");
}

} // namespace

int main()
{
	test_rgb_to_hsv_primaries();
	test_rgb_to_hsv_matches_opencv();
	test_range_from_color_stays_in_domain();
	test_range_clamps_at_edges();
	test_default_palette_separation();
	test_segment_finds_panel_as_one_region();
	test_to_hsv_rejects_unsupported_layouts();
	test_spatial_template_normalization();
	test_profile_is_a_value();
	return 0;
}

#include "ColorSegmenter.hpp"

#include <shared/utils/Logger.hpp>
#include <opencv2/imgproc.hpp>

namespace OverlayCut::Internal::Processing {

Types::Image ColorSegmenter::threshold(const Types::Image& hsv, const Domain::ColorRange& range) {
    Types::Image mask;
    cv::inRange(hsv, range.lowerScalar(), range.upperScalar(), mask);
    return mask;
}

std::vector<Blob> ColorSegmenter::extractBlobs(const Types::Image& mask) {
    std::vector<std::vector<cv::Point>> contours;
    std::vector<cv::Vec4i> hierarchy;
    cv::findContours(mask, contours, hierarchy, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    std::vector<Blob> blobs;
    blobs.reserve(contours.size());
    for (size_t i = 0; i < contours.size(); ++i) {
        Blob blob;
        blob.area = cv::contourArea(contours[i]);
        blob.boundingBox = cv::boundingRect(contours[i]);
        blob.discoveryIndex = static_cast<int>(i);
        blobs.push_back(blob);
    }

    LOG_DEBUG("Extracted ", blobs.size(), " external regions from ", mask.cols, "x", mask.rows,
              " mask");
    return blobs;
}

std::vector<Blob> ColorSegmenter::segment(const Types::Image& hsv, const Domain::ColorRange& range) {
    return extractBlobs(threshold(hsv, range));
}

double ColorSegmenter::matchRatio(const Types::Image& hsvRoi, const Domain::ColorRange& range) {
    const double area = static_cast<double>(hsvRoi.cols) * hsvRoi.rows;
    if (area <= 0.0) return 0.0;

    const Types::Image mask = threshold(hsvRoi, range);
    return cv::countNonZero(mask) / area;
}

}  // namespace OverlayCut::Internal::Processing

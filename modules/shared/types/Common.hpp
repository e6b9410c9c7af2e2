#pragma once

#include <opencv2/core.hpp>
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace OverlayCut::Types {

using Image = cv::Mat;
using Rect = cv::Rect;
using Size = cv::Size;
using HsvTriple = cv::Vec3d;  // H in [0,180], S and V in [0,255]
using Seconds = double;

struct Rgb {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

// 8-bit OpenCV HSV discretization
constexpr double HSV_HUE_MAX = 180.0;
constexpr double HSV_SATURATION_MAX = 255.0;
constexpr double HSV_VALUE_MAX = 255.0;

constexpr Seconds DEFAULT_CLUSTER_TOLERANCE = 0.5;
constexpr Seconds DEFAULT_MIN_SEGMENT = 0.1;

enum class SessionStatus { IDLE, CALIBRATING, SCANNING, COMPLETED, ABORTED, FAILED };

inline std::string toString(SessionStatus status) {
    switch (status) {
        case SessionStatus::IDLE: return "idle";
        case SessionStatus::CALIBRATING: return "calibrating";
        case SessionStatus::SCANNING: return "scanning";
        case SessionStatus::COMPLETED: return "completed";
        case SessionStatus::ABORTED: return "aborted";
        case SessionStatus::FAILED: return "failed";
    }
    return "unknown";
}

struct ConfidenceScore {
    float value = 0.0f;
    bool isValid() const { return value >= 0.0f && value <= 1.0f; }

    static ConfidenceScore fromValue(float v) {
        ConfidenceScore score;
        score.value = std::clamp(v, 0.0f, 1.0f);
        return score;
    }
};

}  // namespace OverlayCut::Types

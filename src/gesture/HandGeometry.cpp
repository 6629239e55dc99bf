/**
 * @file HandGeometry.cpp
 * @brief Implementation of hand landmark measurements
 */

#include "handcal/gesture/HandGeometry.hpp"
#include <algorithm>
#include <cmath>

namespace handcal {
namespace gesture {

double distance(const cv::Point& a, const cv::Point& b) {
    const double dx = static_cast<double>(a.x) - b.x;
    const double dy = static_cast<double>(a.y) - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

std::optional<cv::Point> find_landmark(const LandmarkSet& landmarks, int index) {
    // Detector output is ordered, so the direct slot is almost always the match
    if (index >= 0 && static_cast<std::size_t>(index) < landmarks.size() &&
        landmarks[index].index == index) {
        return landmarks[index].position;
    }

    auto it = std::find_if(landmarks.begin(), landmarks.end(),
                           [index](const Landmark& lm) { return lm.index == index; });
    if (it == landmarks.end()) {
        return std::nullopt;
    }
    return it->position;
}

double hand_size(const LandmarkSet& landmarks) {
    if (landmarks.size() < 10) {
        return HAND_SIZE_FALLBACK;
    }

    return distance(landmarks[LandmarkIndex::WRIST].position,
                    landmarks[LandmarkIndex::MIDDLE_MCP].position);
}

std::optional<double> pinch_distance(const LandmarkSet& landmarks) {
    if (landmarks.size() < 9) {
        return std::nullopt;
    }

    return distance(landmarks[LandmarkIndex::THUMB_TIP].position,
                    landmarks[LandmarkIndex::INDEX_TIP].position);
}

std::optional<cv::Point> hand_center(const LandmarkSet& landmarks) {
    if (landmarks.size() < 10) {
        return std::nullopt;
    }

    const cv::Point& wrist = landmarks[LandmarkIndex::WRIST].position;
    const cv::Point& middle_mcp = landmarks[LandmarkIndex::MIDDLE_MCP].position;
    return cv::Point((wrist.x + middle_mcp.x) / 2, (wrist.y + middle_mcp.y) / 2);
}

cv::Point clamp_to_frame(const cv::Point& point, const cv::Size& bounds) {
    cv::Point clamped = point;
    if (bounds.width > 0) {
        clamped.x = std::clamp(point.x, 0, bounds.width - 1);
    }
    if (bounds.height > 0) {
        clamped.y = std::clamp(point.y, 0, bounds.height - 1);
    }
    return clamped;
}

LandmarkSet clamp_to_frame(const LandmarkSet& landmarks, const cv::Size& bounds) {
    LandmarkSet clamped;
    clamped.reserve(landmarks.size());
    for (const auto& lm : landmarks) {
        clamped.emplace_back(lm.index, clamp_to_frame(lm.position, bounds));
    }
    return clamped;
}

} // namespace gesture
} // namespace handcal

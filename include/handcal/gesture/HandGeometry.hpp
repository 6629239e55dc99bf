/**
 * @file HandGeometry.hpp
 * @brief Stateless geometric measurements on hand landmark sets
 *
 * @copyright 2025 handcal Project
 * @license MIT License
 */

#ifndef HANDCAL_GESTURE_HAND_GEOMETRY_HPP
#define HANDCAL_GESTURE_HAND_GEOMETRY_HPP

#include <optional>
#include <opencv2/core.hpp>
#include "GestureTypes.hpp"

namespace handcal {
namespace gesture {

/**
 * @brief Euclidean distance between two pixel points
 */
double distance(const cv::Point& a, const cv::Point& b);

/**
 * @brief Find a landmark by anatomical index
 *
 * @return Landmark position, or std::nullopt if the set has no such index
 */
std::optional<cv::Point> find_landmark(const LandmarkSet& landmarks, int index);

/**
 * @brief Hand size: distance from wrist (0) to middle finger MCP (9)
 *
 * Landmarks are addressed by position in the set, matching the detector's
 * ordered output.
 *
 * @return Hand size in pixels, or HAND_SIZE_FALLBACK if fewer than 10
 *         landmarks are present
 */
double hand_size(const LandmarkSet& landmarks);

/**
 * @brief Pinch distance: thumb tip (4) to index tip (8)
 *
 * @return Distance in pixels, or std::nullopt if fewer than 9 landmarks
 */
std::optional<double> pinch_distance(const LandmarkSet& landmarks);

/**
 * @brief Palm center: integer midpoint of wrist (0) and middle MCP (9)
 *
 * @return Center, or std::nullopt if fewer than 10 landmarks
 */
std::optional<cv::Point> hand_center(const LandmarkSet& landmarks);

/**
 * @brief Clamp a point into [0, width-1] x [0, height-1]
 *
 * A non-positive bound leaves that axis unclamped.
 */
cv::Point clamp_to_frame(const cv::Point& point, const cv::Size& bounds);

/**
 * @brief Clamp every landmark of a set into the frame
 */
LandmarkSet clamp_to_frame(const LandmarkSet& landmarks, const cv::Size& bounds);

} // namespace gesture
} // namespace handcal

#endif // HANDCAL_GESTURE_HAND_GEOMETRY_HPP

/**
 * @file GestureTypes.hpp
 * @brief Core data types for hand tracking and gesture calibration
 *
 * Defines the landmark representation produced by the external hand
 * detector, finger identities, and the tracking/calibration configuration
 * structures shared by the gesture module.
 *
 * @copyright 2025 handcal Project
 * @license MIT License
 */

#ifndef HANDCAL_GESTURE_TYPES_HPP
#define HANDCAL_GESTURE_TYPES_HPP

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace handcal {
namespace gesture {

/// Number of landmarks the detector reports per hand
constexpr std::size_t HAND_LANDMARK_COUNT = 21;

/// Hand size reported for malformed (too short) landmark sets
constexpr double HAND_SIZE_FALLBACK = 100.0;

/**
 * @brief Landmark indices (MediaPipe hand convention)
 *
 * 0: Wrist
 * 1-4: Thumb (CMC, MCP, IP, TIP)
 * 5-8: Index finger (MCP, PIP, DIP, TIP)
 * 9-12: Middle finger (MCP, PIP, DIP, TIP)
 * 13-16: Ring finger (MCP, PIP, DIP, TIP)
 * 17-20: Pinky (MCP, PIP, DIP, TIP)
 */
struct LandmarkIndex {
    static constexpr int WRIST = 0;
    static constexpr int THUMB_IP = 3;
    static constexpr int THUMB_TIP = 4;
    static constexpr int INDEX_PIP = 6;
    static constexpr int INDEX_TIP = 8;
    static constexpr int MIDDLE_MCP = 9;
    static constexpr int MIDDLE_PIP = 10;
    static constexpr int MIDDLE_TIP = 12;
    static constexpr int RING_PIP = 14;
    static constexpr int RING_TIP = 16;
    static constexpr int PINKY_PIP = 18;
    static constexpr int PINKY_TIP = 20;
};

/**
 * @brief Single labeled landmark in pixel coordinates
 */
struct Landmark {
    int index = 0;              ///< Anatomical identity [0-20]
    cv::Point position;         ///< Pixel coordinates, clamped to the frame

    Landmark() = default;
    Landmark(int idx, const cv::Point& pos) : index(idx), position(pos) {}
    Landmark(int idx, int x, int y) : index(idx), position(x, y) {}

    bool operator==(const Landmark& other) const {
        return index == other.index && position == other.position;
    }
    bool operator!=(const Landmark& other) const { return !(*this == other); }
};

/**
 * @brief Ordered landmark set for one hand in one frame
 *
 * Nominally HAND_LANDMARK_COUNT entries with indices 0..20 in order.
 * Shorter sets are accepted everywhere and treated as malformed input.
 */
using LandmarkSet = std::vector<Landmark>;

/**
 * @brief Build a landmark set from detector points, numbering them 0..N-1
 */
inline LandmarkSet make_landmark_set(const std::vector<cv::Point>& points) {
    LandmarkSet set;
    set.reserve(points.size());
    for (std::size_t i = 0; i < points.size(); ++i) {
        set.emplace_back(static_cast<int>(i), points[i]);
    }
    return set;
}

/**
 * @brief Finger identities
 */
enum class Finger {
    THUMB = 0,
    INDEX,
    MIDDLE,
    RING,
    PINKY
};

/// All fingers in anatomical order
constexpr std::array<Finger, 5> ALL_FINGERS = {
    Finger::THUMB, Finger::INDEX, Finger::MIDDLE, Finger::RING, Finger::PINKY
};

/**
 * @brief Per-finger extended flag (true = extended)
 */
using FingerStates = std::map<Finger, bool>;

/**
 * @brief Convert Finger enum to lowercase name ("thumb", "index", ...)
 */
inline std::string finger_to_string(Finger finger) {
    switch (finger) {
        case Finger::THUMB: return "thumb";
        case Finger::INDEX: return "index";
        case Finger::MIDDLE: return "middle";
        case Finger::RING: return "ring";
        case Finger::PINKY: return "pinky";
        default: return "invalid";
    }
}

/**
 * @brief Gestures captured by the calibration protocol, in capture order
 */
enum class CalibrationGesture {
    OPEN_HAND = 0,
    FIST,
    PINCH,
    POINTING,
    VICTORY
};

/// Fixed calibration order
constexpr std::array<CalibrationGesture, 5> CALIBRATION_SEQUENCE = {
    CalibrationGesture::OPEN_HAND,
    CalibrationGesture::FIST,
    CalibrationGesture::PINCH,
    CalibrationGesture::POINTING,
    CalibrationGesture::VICTORY
};

/**
 * @brief Convert CalibrationGesture to its step name ("open_hand", "fist", ...)
 */
inline std::string calibration_gesture_to_string(CalibrationGesture gesture) {
    switch (gesture) {
        case CalibrationGesture::OPEN_HAND: return "open_hand";
        case CalibrationGesture::FIST: return "fist";
        case CalibrationGesture::PINCH: return "pinch";
        case CalibrationGesture::POINTING: return "pointing";
        case CalibrationGesture::VICTORY: return "victory";
        default: return "invalid";
    }
}

/**
 * @brief Point tracked by the position smoothing buffer
 */
enum class PointOfInterest {
    INDEX_TIP,      ///< Landmark 8
    PALM_CENTER     ///< Midpoint of wrist (0) and middle MCP (9)
};

/**
 * @brief Hand tracking session configuration
 */
struct TrackingConfig {
    /// Smoothing window capacity (frames)
    std::size_t buffer_capacity = 5;

    /// Weight of the oldest frame in the window
    double min_weight = 0.3;

    /// Weight of the newest frame in the window
    double max_weight = 1.0;

    /// Mean landmark displacement (pixels) below which the hand is stable
    double landmark_stability_threshold = 10.0;

    /// Position variance (pixels^2) below which the point of interest is stable
    double position_stability_threshold = 10.0;

    /// Number of recent smoothed sets compared by the stability check
    std::size_t stability_window = 3;

    /// Counter value that maps to a stability score of 100
    int stability_score_cap = 10;

    /// Point fed to the position buffer
    PointOfInterest point_of_interest = PointOfInterest::INDEX_TIP;

    /**
     * @brief Validate configuration
     */
    bool is_valid() const {
        return buffer_capacity > 0 &&
               min_weight > 0.0 && max_weight >= min_weight &&
               landmark_stability_threshold > 0.0 &&
               position_stability_threshold > 0.0 &&
               stability_window >= 2 && stability_window <= buffer_capacity &&
               stability_score_cap > 0;
    }
};

/**
 * @brief Threshold derivation ratios
 */
struct CalibrationConfig {
    /// Finger extension threshold as a fraction of the open-hand size
    double finger_threshold_ratio = 0.12;

    /// Pinch threshold as a multiple of the measured pinch distance
    double pinch_threshold_ratio = 1.5;

    bool is_valid() const {
        return finger_threshold_ratio > 0.0 && pinch_threshold_ratio > 0.0;
    }
};

} // namespace gesture
} // namespace handcal

#endif // HANDCAL_GESTURE_TYPES_HPP

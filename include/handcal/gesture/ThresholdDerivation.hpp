/**
 * @file ThresholdDerivation.hpp
 * @brief Conversion of calibration snapshots into classifier thresholds
 *
 * @copyright 2025 handcal Project
 * @license MIT License
 */

#ifndef HANDCAL_GESTURE_THRESHOLD_DERIVATION_HPP
#define HANDCAL_GESTURE_THRESHOLD_DERIVATION_HPP

#include <map>
#include <optional>
#include <string>
#include <handcal/core/types.hpp>
#include "GestureTypes.hpp"

namespace handcal {
namespace gesture {

/**
 * @brief Measurement captured for one calibration step
 */
struct CalibrationSnapshot {
    double hand_size = 0.0;         ///< hand_size() of the captured landmarks
    LandmarkSet landmarks;          ///< Raw landmarks of the first valid frame
    FingerStates finger_states;     ///< classify_fingers() of the landmarks
    double timestamp = 0.0;         ///< Capture time in seconds (tick counter)
};

/// At most one snapshot per step
using SnapshotMap = std::map<CalibrationGesture, CalibrationSnapshot>;

/**
 * @brief Per-user thresholds consumed by the downstream gesture classifier
 */
struct ThresholdSet {
    std::map<Finger, double> finger_thresholds;     ///< Extension threshold per finger (pixels)
    std::optional<double> pinch_threshold;          ///< Thumb-index distance threshold (pixels)
    double base_hand_size = 0.0;                    ///< Open-hand size the thresholds scale with
};

/**
 * @brief Outcome of threshold derivation
 */
struct ThresholdDerivationResult {
    core::ResultCode code = core::ResultCode::ERROR_NOT_INITIALIZED;
    std::string message;
    std::optional<ThresholdSet> thresholds;     ///< Set only on success

    bool ok() const { return code == core::ResultCode::SUCCESS; }
};

/**
 * @brief Derive thresholds from captured calibration snapshots
 *
 * - open_hand is mandatory; without it the result is
 *   ERROR_CALIBRATION_INVALID and no thresholds are produced.
 * - base_hand_size = open_hand hand size.
 * - Every finger present in both the open_hand and fist finger states gets
 *   base_hand_size * finger_threshold_ratio. The states themselves are not
 *   compared; the fist snapshot only gates which fingers get a threshold.
 * - A pinch snapshot with at least 9 landmarks sets
 *   pinch_threshold = pinch_distance * pinch_threshold_ratio.
 * - pointing and victory snapshots are accepted but not used.
 */
ThresholdDerivationResult derive_thresholds(const SnapshotMap& snapshots,
                                            const CalibrationConfig& config = CalibrationConfig());

} // namespace gesture
} // namespace handcal

#endif // HANDCAL_GESTURE_THRESHOLD_DERIVATION_HPP

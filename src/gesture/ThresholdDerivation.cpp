/**
 * @file ThresholdDerivation.cpp
 * @brief Implementation of calibration threshold derivation
 */

#include "handcal/gesture/ThresholdDerivation.hpp"
#include "handcal/gesture/HandGeometry.hpp"
#include <handcal/core/Logger.hpp>
#include <iomanip>
#include <sstream>

namespace handcal {
namespace gesture {

ThresholdDerivationResult derive_thresholds(const SnapshotMap& snapshots,
                                            const CalibrationConfig& config) {
    ThresholdDerivationResult result;

    auto open_it = snapshots.find(CalibrationGesture::OPEN_HAND);
    if (open_it == snapshots.end()) {
        result.code = core::ResultCode::ERROR_CALIBRATION_INVALID;
        result.message = "Calibration failed: Missing open hand data";
        HANDCAL_LOG_WARNING("ThresholdDerivation") << result.message;
        return result;
    }

    ThresholdSet thresholds;
    thresholds.base_hand_size = open_it->second.hand_size;

    auto fist_it = snapshots.find(CalibrationGesture::FIST);
    if (fist_it != snapshots.end()) {
        const FingerStates& open_states = open_it->second.finger_states;
        const FingerStates& fist_states = fist_it->second.finger_states;

        for (const auto& entry : open_states) {
            if (fist_states.count(entry.first) > 0) {
                thresholds.finger_thresholds[entry.first] =
                    thresholds.base_hand_size * config.finger_threshold_ratio;
            }
        }
    }

    auto pinch_it = snapshots.find(CalibrationGesture::PINCH);
    if (pinch_it != snapshots.end()) {
        if (auto pinch = pinch_distance(pinch_it->second.landmarks)) {
            thresholds.pinch_threshold = *pinch * config.pinch_threshold_ratio;
        }
    }

    std::ostringstream message;
    message << "Calibration complete! Hand size: "
            << std::fixed << std::setprecision(1) << thresholds.base_hand_size;

    result.code = core::ResultCode::SUCCESS;
    result.message = message.str();
    result.thresholds = std::move(thresholds);
    return result;
}

} // namespace gesture
} // namespace handcal

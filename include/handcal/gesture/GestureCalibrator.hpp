/**
 * @file GestureCalibrator.hpp
 * @brief Five-step per-user gesture calibration state machine
 *
 * Walks the user through open_hand -> fist -> pinch -> pointing -> victory,
 * captures one snapshot per step and derives the classifier thresholds when
 * the last step is confirmed.
 *
 * @copyright 2025 handcal Project
 * @license MIT License
 */

#ifndef HANDCAL_GESTURE_GESTURE_CALIBRATOR_HPP
#define HANDCAL_GESTURE_GESTURE_CALIBRATOR_HPP

#include <memory>
#include <optional>
#include <string>
#include <handcal/core/types.hpp>
#include "GestureTypes.hpp"
#include "ThresholdDerivation.hpp"

namespace handcal {
namespace gesture {

/**
 * @brief Calibrator lifecycle
 */
enum class CalibrationState {
    IDLE,           ///< Not started, or reset
    CAPTURING,      ///< On one of the five steps
    COMPLETE        ///< Last step confirmed, derivation attempted
};

/**
 * @brief Step report returned by start() and advance()
 */
struct CalibrationProgress {
    core::ResultCode code = core::ResultCode::SUCCESS;
    int step = 0;                                   ///< 1-based step number
    int total_steps = static_cast<int>(CALIBRATION_SEQUENCE.size());
    CalibrationGesture gesture = CalibrationGesture::OPEN_HAND;
    std::string gesture_name;
    std::string message;                            ///< Human-readable instruction or outcome
    double progress = 0.0;                          ///< step / total_steps

    bool complete = false;                          ///< Set by the terminal advance()
    std::optional<ThresholdSet> thresholds;         ///< Present only on successful completion
};

/**
 * @brief Live feedback returned by process() for every accepted frame
 */
struct CalibrationFeedback {
    int step = 0;                                   ///< 1-based step number
    int total_steps = static_cast<int>(CALIBRATION_SEQUENCE.size());
    CalibrationGesture gesture = CalibrationGesture::OPEN_HAND;
    std::string gesture_name;
    double hand_size = 0.0;                         ///< Hand size of this frame
    double progress = 0.0;
    bool captured = false;                          ///< This frame produced the step's snapshot
};

/**
 * @brief Calibration state machine
 *
 * States: IDLE -> CAPTURING(open_hand .. victory) -> COMPLETE. reset() returns
 * to IDLE from any state.
 *
 * Only the first valid frame of each step is stored; later frames on the
 * same step still produce feedback but never overwrite the snapshot.
 *
 * Thread-safety: Not thread-safe.
 */
class GestureCalibrator {
public:
    GestureCalibrator();

    /**
     * @throws core::ConfigurationException if config is invalid
     */
    explicit GestureCalibrator(const CalibrationConfig& config);

    ~GestureCalibrator();

    GestureCalibrator(const GestureCalibrator&) = delete;
    GestureCalibrator& operator=(const GestureCalibrator&) = delete;
    GestureCalibrator(GestureCalibrator&&) noexcept;
    GestureCalibrator& operator=(GestureCalibrator&&) noexcept;

    /**
     * @brief Begin (or restart) calibration at open_hand
     *
     * Discards snapshots and any previously derived thresholds.
     */
    CalibrationProgress start();

    /**
     * @brief Feed one frame's landmarks to the active step
     *
     * @return std::nullopt if not capturing or @p landmarks is empty
     */
    std::optional<CalibrationFeedback> process(const LandmarkSet& landmarks);

    /**
     * @brief Confirm the active step
     *
     * Moves to the next gesture, or on victory completes calibration and
     * derives thresholds. Outside CAPTURING nothing changes and the result
     * carries ERROR_NOT_INITIALIZED.
     */
    CalibrationProgress advance();

    /**
     * @brief Return to IDLE, discarding snapshots and thresholds
     */
    void reset();

    CalibrationState state() const;
    bool is_calibrating() const;
    bool is_complete() const;

    /// 0-based index of the active step
    int current_step() const;

    /// Active gesture, std::nullopt outside CAPTURING
    std::optional<CalibrationGesture> current_gesture() const;

    const SnapshotMap& snapshots() const;

    /// Derived thresholds, std::nullopt until a successful completion
    std::optional<ThresholdSet> thresholds() const;

    /// Base hand size of the derived thresholds, HAND_SIZE_FALLBACK if none
    double base_hand_size() const;

    CalibrationConfig get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;  ///< PIMPL idiom for implementation hiding
};

/**
 * @brief Convert CalibrationState to string
 */
std::string calibration_state_to_string(CalibrationState state);

} // namespace gesture
} // namespace handcal

#endif // HANDCAL_GESTURE_GESTURE_CALIBRATOR_HPP

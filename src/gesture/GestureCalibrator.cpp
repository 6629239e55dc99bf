/**
 * @file GestureCalibrator.cpp
 * @brief Implementation of the calibration state machine
 */

#include "handcal/gesture/GestureCalibrator.hpp"
#include "handcal/gesture/FingerStateClassifier.hpp"
#include "handcal/gesture/HandGeometry.hpp"
#include <handcal/core/Logger.hpp>
#include <handcal/core/exception.hpp>
#include <opencv2/core/utility.hpp>
#include <algorithm>
#include <cctype>

namespace handcal {
namespace gesture {

namespace {

constexpr int TOTAL_STEPS = static_cast<int>(CALIBRATION_SEQUENCE.size());

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

double tick_seconds() {
    return static_cast<double>(cv::getTickCount()) / cv::getTickFrequency();
}

} // namespace

/**
 * @brief PIMPL implementation for GestureCalibrator
 */
class GestureCalibrator::Impl {
public:
    CalibrationConfig config;
    CalibrationState state = CalibrationState::IDLE;
    int current_step = 0;
    SnapshotMap snapshots;
    std::optional<ThresholdSet> thresholds;

    explicit Impl(const CalibrationConfig& cfg) : config(cfg) {
        if (!cfg.is_valid()) {
            HANDCAL_THROW(core::ConfigurationException, "Invalid calibration configuration");
        }
    }

    CalibrationGesture gesture() const {
        return CALIBRATION_SEQUENCE[current_step];
    }

    double progress() const {
        return static_cast<double>(current_step + 1) / TOTAL_STEPS;
    }

    CalibrationProgress step_report(const std::string& message) const {
        CalibrationProgress report;
        report.step = current_step + 1;
        report.gesture = gesture();
        report.gesture_name = calibration_gesture_to_string(report.gesture);
        report.progress = progress();
        report.message = message;
        return report;
    }

    void clear() {
        snapshots.clear();
        thresholds.reset();
        current_step = 0;
    }
};

GestureCalibrator::GestureCalibrator()
    : GestureCalibrator(CalibrationConfig()) {
}

GestureCalibrator::GestureCalibrator(const CalibrationConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
}

GestureCalibrator::~GestureCalibrator() = default;

GestureCalibrator::GestureCalibrator(GestureCalibrator&&) noexcept = default;
GestureCalibrator& GestureCalibrator::operator=(GestureCalibrator&&) noexcept = default;

CalibrationProgress GestureCalibrator::start() {
    pImpl->clear();
    pImpl->state = CalibrationState::CAPTURING;

    HANDCAL_LOG_INFO("GestureCalibrator") << "Calibration started";

    return pImpl->step_report("Step 1/" + std::to_string(TOTAL_STEPS) + ": Show OPEN HAND");
}

std::optional<CalibrationFeedback> GestureCalibrator::process(const LandmarkSet& landmarks) {
    if (pImpl->state != CalibrationState::CAPTURING || landmarks.empty()) {
        return std::nullopt;
    }

    const CalibrationGesture gesture = pImpl->gesture();
    const double size = hand_size(landmarks);

    CalibrationFeedback feedback;
    feedback.step = pImpl->current_step + 1;
    feedback.gesture = gesture;
    feedback.gesture_name = calibration_gesture_to_string(gesture);
    feedback.hand_size = size;
    feedback.progress = pImpl->progress();

    // First sample wins: later frames on the same step never overwrite it
    if (pImpl->snapshots.count(gesture) == 0) {
        CalibrationSnapshot snapshot;
        snapshot.hand_size = size;
        snapshot.landmarks = landmarks;
        snapshot.finger_states = classify_fingers(landmarks);
        snapshot.timestamp = tick_seconds();
        pImpl->snapshots.emplace(gesture, std::move(snapshot));
        feedback.captured = true;

        HANDCAL_LOG_DEBUG("GestureCalibrator")
            << "Captured " << feedback.gesture_name << " (hand size " << size << ")";
    }

    return feedback;
}

CalibrationProgress GestureCalibrator::advance() {
    if (pImpl->state != CalibrationState::CAPTURING) {
        CalibrationProgress report;
        report.code = core::ResultCode::ERROR_NOT_INITIALIZED;
        report.complete = pImpl->state == CalibrationState::COMPLETE;
        report.message = report.complete ? "Calibration already complete"
                                         : "Calibration not started";
        HANDCAL_LOG_WARNING("GestureCalibrator") << "advance() ignored: " << report.message;
        return report;
    }

    if (pImpl->current_step < TOTAL_STEPS - 1) {
        pImpl->current_step++;
        const std::string name = calibration_gesture_to_string(pImpl->gesture());

        HANDCAL_LOG_INFO("GestureCalibrator")
            << "Step " << (pImpl->current_step + 1) << "/" << TOTAL_STEPS << ": " << name;

        return pImpl->step_report("Step " + std::to_string(pImpl->current_step + 1) + "/" +
                                  std::to_string(TOTAL_STEPS) + ": " + to_upper(name));
    }

    // Last step confirmed
    pImpl->state = CalibrationState::COMPLETE;
    ThresholdDerivationResult derived = derive_thresholds(pImpl->snapshots, pImpl->config);
    pImpl->thresholds = derived.thresholds;

    CalibrationProgress report = pImpl->step_report(derived.message);
    report.code = derived.code;
    report.complete = true;
    report.thresholds = derived.thresholds;

    if (derived.ok()) {
        HANDCAL_LOG_INFO("GestureCalibrator") << derived.message;
    }
    return report;
}

void GestureCalibrator::reset() {
    pImpl->clear();
    pImpl->state = CalibrationState::IDLE;
}

CalibrationState GestureCalibrator::state() const {
    return pImpl->state;
}

bool GestureCalibrator::is_calibrating() const {
    return pImpl->state == CalibrationState::CAPTURING;
}

bool GestureCalibrator::is_complete() const {
    return pImpl->state == CalibrationState::COMPLETE;
}

int GestureCalibrator::current_step() const {
    return pImpl->current_step;
}

std::optional<CalibrationGesture> GestureCalibrator::current_gesture() const {
    if (pImpl->state != CalibrationState::CAPTURING) {
        return std::nullopt;
    }
    return pImpl->gesture();
}

const SnapshotMap& GestureCalibrator::snapshots() const {
    return pImpl->snapshots;
}

std::optional<ThresholdSet> GestureCalibrator::thresholds() const {
    return pImpl->thresholds;
}

double GestureCalibrator::base_hand_size() const {
    if (!pImpl->thresholds) {
        return HAND_SIZE_FALLBACK;
    }
    return pImpl->thresholds->base_hand_size;
}

CalibrationConfig GestureCalibrator::get_config() const {
    return pImpl->config;
}

std::string calibration_state_to_string(CalibrationState state) {
    switch (state) {
        case CalibrationState::IDLE: return "Idle";
        case CalibrationState::CAPTURING: return "Capturing";
        case CalibrationState::COMPLETE: return "Complete";
        default: return "Invalid";
    }
}

} // namespace gesture
} // namespace handcal

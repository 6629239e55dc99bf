/**
 * @file handcal_replay.cpp
 * @brief Headless replay of synthetic hand landmarks through tracking and calibration
 *
 * Generates a hand that sweeps across a 640x480 frame, drops out for a few
 * frames and then rests, printing smoothing and stability output per frame.
 * Afterwards it runs the five calibration gestures and prints the derived
 * thresholds. No camera or detector is needed.
 *
 * Usage: handcal_replay [config.yaml]
 *
 * @copyright 2025 handcal Project
 * @license MIT License
 */

#include <handcal/gesture/HandTrackingSession.hpp>
#include <handcal/gesture/GestureCalibrator.hpp>
#include <handcal/gesture/FingerStateClassifier.hpp>
#include <handcal/core/Configuration.hpp>
#include <handcal/core/Logger.hpp>
#include <handcal/core/exception.hpp>
#include <iostream>
#include <iomanip>
#include <vector>

using namespace handcal;

namespace {

const cv::Size FRAME_SIZE(640, 480);

/**
 * @brief Upright open hand, wrist at the origin, fingers pointing up (-y)
 */
std::vector<cv::Point> open_hand_template() {
    return {
        {0, 0},                                             // wrist
        {-30, -20}, {-50, -45}, {-65, -70}, {-75, -95},     // thumb
        {-25, -90}, {-28, -125}, {-30, -150}, {-32, -170},  // index
        {0, -95}, {0, -135}, {0, -160}, {0, -185},          // middle
        {22, -90}, {24, -125}, {26, -148}, {28, -166},      // ring
        {42, -80}, {46, -105}, {48, -122}, {50, -138}       // pinky
    };
}

gesture::LandmarkSet make_hand(const std::vector<cv::Point>& shape, const cv::Point& wrist) {
    std::vector<cv::Point> points;
    points.reserve(shape.size());
    for (const auto& p : shape) {
        points.push_back(p + wrist);
    }
    return gesture::make_landmark_set(points);
}

/// Fold the given fingers so their tips sit below the PIP joint
std::vector<cv::Point> fold(std::vector<cv::Point> shape, const std::vector<int>& tips) {
    for (int tip : tips) {
        shape[tip].y = shape[tip - 2].y + 25;
        shape[tip - 1].y = shape[tip - 2].y + 15;
    }
    return shape;
}

gesture::LandmarkSet calibration_pose(gesture::CalibrationGesture gesture, const cv::Point& wrist) {
    using gesture::LandmarkIndex;
    const std::vector<cv::Point> open = open_hand_template();

    switch (gesture) {
        case gesture::CalibrationGesture::FIST:
            return make_hand(fold(open, {LandmarkIndex::THUMB_TIP, LandmarkIndex::INDEX_TIP,
                                         LandmarkIndex::MIDDLE_TIP, LandmarkIndex::RING_TIP,
                                         LandmarkIndex::PINKY_TIP}), wrist);
        case gesture::CalibrationGesture::PINCH: {
            std::vector<cv::Point> shape = open;
            shape[LandmarkIndex::THUMB_TIP] = shape[LandmarkIndex::INDEX_TIP] + cv::Point(6, 8);
            return make_hand(shape, wrist);
        }
        case gesture::CalibrationGesture::POINTING:
            return make_hand(fold(open, {LandmarkIndex::MIDDLE_TIP, LandmarkIndex::RING_TIP,
                                         LandmarkIndex::PINKY_TIP}), wrist);
        case gesture::CalibrationGesture::VICTORY:
            return make_hand(fold(open, {LandmarkIndex::RING_TIP, LandmarkIndex::PINKY_TIP}), wrist);
        case gesture::CalibrationGesture::OPEN_HAND:
        default:
            return make_hand(open, wrist);
    }
}

void run_tracking(const gesture::TrackingConfig& config) {
    gesture::HandTrackingSession session(config);
    const std::vector<cv::Point> shape = open_hand_template();

    session.calibrate(make_hand(shape, cv::Point(320, 400)));

    std::cout << "\n=== Tracking replay ===" << std::endl;
    std::cout << std::left << std::setw(7) << "frame" << std::setw(8) << "hand"
              << std::setw(14) << "poi" << std::setw(8) << "score" << "stable" << std::endl;

    for (int frame = 0; frame < 40; ++frame) {
        std::optional<gesture::LandmarkSet> detection;

        if (frame < 15) {
            // Sweep left to right
            detection = make_hand(shape, cv::Point(150 + frame * 20, 400));
        } else if (frame < 18) {
            // Detector misses the hand
            detection = std::nullopt;
        } else {
            // Resting with one pixel of jitter
            detection = make_hand(shape, cv::Point(450 + (frame % 2), 400));
        }

        gesture::HandTrackingResult result = session.process_frame(detection, FRAME_SIZE);

        std::string poi = "-";
        if (result.point_of_interest) {
            poi = "(" + std::to_string(result.point_of_interest->x) + "," +
                  std::to_string(result.point_of_interest->y) + ")";
        }

        std::cout << std::left << std::setw(7) << frame
                  << std::setw(8) << (result.hand_detected ? "yes" : "no")
                  << std::setw(14) << poi
                  << std::setw(8) << result.stability_score
                  << (result.stability_evaluated ? (result.is_stable ? "yes" : "no") : "-")
                  << std::endl;
    }

    std::cout << "Point of interest stable: " << (session.is_hand_stable() ? "yes" : "no") << std::endl;
    if (auto normalized = session.normalize(50.0)) {
        std::cout << "50 px in hand units: " << std::fixed << std::setprecision(3)
                  << *normalized << std::endl;
    }
}

bool run_calibration(const gesture::CalibrationConfig& config) {
    gesture::GestureCalibrator calibrator(config);
    const cv::Point wrist(320, 400);

    std::cout << "\n=== Calibration ===" << std::endl;
    gesture::CalibrationProgress progress = calibrator.start();
    std::cout << progress.message << std::endl;

    while (calibrator.is_calibrating()) {
        const gesture::CalibrationGesture current = *calibrator.current_gesture();
        const gesture::LandmarkSet pose = calibration_pose(current, wrist);

        // Several frames per step; only the first one is kept
        for (int i = 0; i < 3; ++i) {
            if (auto feedback = calibrator.process(pose)) {
                if (feedback->captured) {
                    std::cout << "  captured " << feedback->gesture_name
                              << " (hand size " << std::fixed << std::setprecision(1)
                              << feedback->hand_size << ", "
                              << gesture::count_extended(gesture::classify_fingers(pose))
                              << " fingers extended)" << std::endl;
                }
            }
        }

        progress = calibrator.advance();
        std::cout << progress.message << std::endl;
    }

    if (!progress.thresholds) {
        std::cerr << "Calibration failed: " << core::resultCodeToString(progress.code) << std::endl;
        return false;
    }

    const gesture::ThresholdSet& thresholds = *progress.thresholds;
    std::cout << "Base hand size: " << thresholds.base_hand_size << std::endl;
    for (const auto& entry : thresholds.finger_thresholds) {
        std::cout << "  " << std::left << std::setw(8) << gesture::finger_to_string(entry.first)
                  << std::fixed << std::setprecision(2) << entry.second << " px" << std::endl;
    }
    if (thresholds.pinch_threshold) {
        std::cout << "  pinch   " << *thresholds.pinch_threshold << " px" << std::endl;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    auto& logger = core::Logger::getInstance();
    logger.setLevel(core::LogLevel::INFO);
    logger.setConsoleOutput(true);

    auto& configuration = core::Configuration::getInstance();
    if (argc > 1 && !configuration.load(argv[1])) {
        std::cerr << "Could not load configuration " << argv[1] << ", using defaults" << std::endl;
    }

    try {
        const gesture::TrackingConfig tracking = configuration.getTrackingConfig();
        const gesture::CalibrationConfig calibration = configuration.getCalibrationConfig();

        run_tracking(tracking);
        if (!run_calibration(calibration)) {
            return 1;
        }
    } catch (const core::Exception& e) {
        HANDCAL_LOG_ERROR("handcal_replay") << e.what() << " [" << e.getContext() << "]";
        return 1;
    }

    return 0;
}

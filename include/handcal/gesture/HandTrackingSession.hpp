/**
 * @file HandTrackingSession.hpp
 * @brief Per-hand temporal smoothing, stability scoring and size reference
 *
 * Combines the smoothing buffers, the stability detector and the geometry
 * utilities into a frame-driven session for one tracked hand.
 *
 * @copyright 2025 handcal Project
 * @license MIT License
 */

#ifndef HANDCAL_GESTURE_HAND_TRACKING_SESSION_HPP
#define HANDCAL_GESTURE_HAND_TRACKING_SESSION_HPP

#include <memory>
#include <optional>
#include <vector>
#include <opencv2/core.hpp>
#include "GestureTypes.hpp"

namespace handcal {
namespace gesture {

/**
 * @brief Per-frame output of a tracking session
 */
struct HandTrackingResult {
    bool hand_detected = false;                     ///< Landmarks were supplied this frame
    std::optional<LandmarkSet> smoothed_landmarks;  ///< Weighted average of the landmark window
    std::optional<cv::Point> point_of_interest;     ///< Smoothed fingertip / palm center
    int stability_score = 0;                        ///< 0-100
    bool is_stable = false;                         ///< Verdict of this frame's evaluation
    bool stability_evaluated = false;               ///< False until the window holds enough sets
};

/**
 * @brief Frame-driven tracking session for one hand
 *
 * Per-frame contract (process_frame):
 * 1. No landmarks (detection failed): stability counter is zeroed, buffers
 *    are left untouched and the result reports no hand.
 * 2. Landmarks are clamped to the frame and pushed into the landmark buffer.
 * 3. The buffer is smoothed; once it holds stability_window sets, the most
 *    recent smoothed sets are checked for stability and the counter updated.
 * 4. The point of interest is taken from the smoothed set, pushed into the
 *    position buffer, and its smoothed value returned.
 *
 * The hand size reference set by calibrate() survives reset().
 *
 * Thread-safety: Not thread-safe. Use one session per hand.
 */
class HandTrackingSession {
public:
    HandTrackingSession();

    /**
     * @throws core::ConfigurationException if config is invalid
     */
    explicit HandTrackingSession(const TrackingConfig& config);

    ~HandTrackingSession();

    HandTrackingSession(const HandTrackingSession&) = delete;
    HandTrackingSession& operator=(const HandTrackingSession&) = delete;
    HandTrackingSession(HandTrackingSession&&) noexcept;
    HandTrackingSession& operator=(HandTrackingSession&&) noexcept;

    /**
     * @brief Process one frame for this hand
     *
     * @param landmarks Detector output, or std::nullopt if the hand was not found
     * @param frame_bounds Frame size used for clamping
     */
    HandTrackingResult process_frame(const std::optional<LandmarkSet>& landmarks,
                                     const cv::Size& frame_bounds);

    /**
     * @brief Record hand_size(landmarks) as the normalization reference
     */
    void calibrate(const LandmarkSet& landmarks);

    /**
     * @brief Drop the normalization reference
     */
    void clear_calibration();

    std::optional<double> hand_size_reference() const;

    /**
     * @brief Divide a pixel measurement by the reference hand size
     *
     * @return std::nullopt if no reference has been recorded
     */
    std::optional<double> normalize(double measurement) const;

    /// Smoothed set from the last frame with a hand (cleared by reset)
    std::optional<LandmarkSet> smoothed_landmarks() const;

    /// Smoothed point of interest from the last frame with a hand
    std::optional<cv::Point> point_of_interest() const;

    int stability_score() const;

    /// Raw verdict of the most recent landmark stability evaluation
    bool is_stable() const;

    /**
     * @brief Point-of-interest variance check over the position buffer
     *
     * @param threshold Variance threshold (std::nullopt = configured default)
     */
    bool is_hand_stable(std::optional<double> threshold = std::nullopt) const;

    /**
     * @brief Clear both buffers and the stability counter
     */
    void reset();

    std::size_t buffered_frames() const;

    TrackingConfig get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;  ///< PIMPL idiom for implementation hiding
};

/**
 * @brief Independent sessions for several simultaneously tracked hands
 *
 * Hand slots follow the detector's output order. A slot missing from a
 * frame is processed as a dropout for its session; sessions never share
 * buffers.
 */
class MultiHandTracker {
public:
    /**
     * @param max_hands Number of hand slots (default: 2)
     * @throws core::ConfigurationException if max_hands is 0 or config is invalid
     */
    explicit MultiHandTracker(std::size_t max_hands = 2,
                              const TrackingConfig& config = TrackingConfig());

    /**
     * @brief Process one frame of detections
     *
     * Detections beyond max_hands are ignored.
     *
     * @return One result per slot
     */
    std::vector<HandTrackingResult> process_frame(const std::vector<LandmarkSet>& hands,
                                                  const cv::Size& frame_bounds);

    /**
     * @throws std::out_of_range if slot >= max_hands
     */
    HandTrackingSession& session(std::size_t slot);
    const HandTrackingSession& session(std::size_t slot) const;

    std::size_t max_hands() const { return sessions_.size(); }

    void reset();

private:
    std::vector<HandTrackingSession> sessions_;
};

} // namespace gesture
} // namespace handcal

#endif // HANDCAL_GESTURE_HAND_TRACKING_SESSION_HPP

/**
 * @file StabilityDetector.hpp
 * @brief Motion-based stability checks and the decaying stability counter
 *
 * Judges whether a tracked hand is held still, either from the displacement
 * of its smoothed landmark sets or from the variance of its point of
 * interest, and accumulates the verdicts into a bounded 0-100 score for
 * caller-side feedback.
 *
 * @copyright 2025 handcal Project
 * @license MIT License
 */

#ifndef HANDCAL_GESTURE_STABILITY_DETECTOR_HPP
#define HANDCAL_GESTURE_STABILITY_DETECTOR_HPP

#include <optional>
#include <vector>
#include <opencv2/core.hpp>
#include "GestureTypes.hpp"

namespace handcal {
namespace gesture {

/**
 * @brief Mean Euclidean displacement between two landmark sets
 *
 * Landmarks are paired by anatomical index; indices present in only one
 * set are ignored.
 *
 * @return Mean displacement in pixels, or std::nullopt if no index is shared
 */
std::optional<double> mean_displacement(const LandmarkSet& first, const LandmarkSet& last);

/**
 * @brief Landmark stability verdict over a window of smoothed sets
 *
 * Compares the first and last set of @p window. Stable iff the mean
 * displacement is strictly below @p threshold.
 *
 * @return false if the window has fewer than 2 sets or no comparable landmarks
 */
bool is_stable(const std::vector<LandmarkSet>& window, double threshold = 10.0);

/**
 * @brief Population variance of x and y over a set of positions
 */
struct PositionVariance {
    double var_x = 0.0;
    double var_y = 0.0;
};

/**
 * @brief Variance of the @p window most recent positions
 *
 * @return std::nullopt if fewer than @p window positions are given
 */
std::optional<PositionVariance> compute_position_variance(const std::vector<cv::Point>& positions,
                                                          std::size_t window = 3);

/**
 * @brief Point-of-interest stability verdict
 *
 * Stable iff both x and y variances of the @p window most recent positions
 * are strictly below @p threshold.
 *
 * @return false if fewer than @p window positions are given
 */
bool is_position_stable(const std::vector<cv::Point>& positions,
                        double threshold = 10.0,
                        std::size_t window = 3);

/**
 * @brief Bounded stability counter
 *
 * +1 per stable evaluation, -1 per unstable evaluation (floored at 0).
 * The score caps the counter at score_cap and scales it to 0-100, so a hand
 * needs score_cap consecutive stable frames to reach 100 and loses it
 * gradually rather than instantly.
 */
class StabilityCounter {
public:
    /**
     * @param score_cap Counter value mapped to a score of 100 (default: 10)
     * @throws core::ConfigurationException if score_cap <= 0
     */
    explicit StabilityCounter(int score_cap = 10);

    /**
     * @brief Record one stability evaluation
     */
    void record(bool stable);

    /**
     * @brief Zero the counter (hand lost or session reset)
     */
    void reset();

    int count() const { return count_; }

    /**
     * @brief Stability score in [0, 100]
     */
    int score() const;

    /**
     * @brief Verdict of the most recent evaluation (false after reset)
     */
    bool last_verdict() const { return last_verdict_; }

    int score_cap() const { return score_cap_; }

private:
    int score_cap_;
    int count_ = 0;
    bool last_verdict_ = false;
};

} // namespace gesture
} // namespace handcal

#endif // HANDCAL_GESTURE_STABILITY_DETECTOR_HPP

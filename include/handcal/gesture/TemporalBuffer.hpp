/**
 * @file TemporalBuffer.hpp
 * @brief Bounded history buffers with recency-weighted smoothing
 *
 * Stores the most recent landmark sets (or single positions) of one tracked
 * hand and produces a weighted moving average biased toward newer frames.
 *
 * @copyright 2025 handcal Project
 * @license MIT License
 */

#ifndef HANDCAL_GESTURE_TEMPORAL_BUFFER_HPP
#define HANDCAL_GESTURE_TEMPORAL_BUFFER_HPP

#include <memory>
#include <optional>
#include <vector>
#include <opencv2/core.hpp>
#include "GestureTypes.hpp"

namespace handcal {
namespace gesture {

/**
 * @brief Normalized recency weights for a window of @p count frames
 *
 * Linearly spaced from @p min_weight (oldest) to @p max_weight (newest),
 * then divided by their sum. A single frame gets weight 1.
 *
 * @return @p count weights summing to 1 (empty for count == 0)
 */
std::vector<double> compute_recency_weights(std::size_t count,
                                            double min_weight = 0.3,
                                            double max_weight = 1.0);

/**
 * @brief Fixed-capacity FIFO of landmark sets with weighted smoothing
 *
 * Typical usage:
 * - Capacity 5 at 30 FPS covers ~170ms of motion
 * - Oldest set is evicted on overflow
 * - Weights are re-derived from the current occupancy on every query, so
 *   smoothing is well defined before the window fills
 *
 * Thread-safety: Not thread-safe. Each tracked hand owns its own buffer.
 *
 * Performance: O(1) push, O(N * 21) smoothing.
 */
class LandmarkSmoothingBuffer {
public:
    /**
     * @brief Constructor with capacity and weight range
     *
     * @param capacity Maximum number of landmark sets (default: 5)
     * @param min_weight Weight of the oldest set (default: 0.3)
     * @param max_weight Weight of the newest set (default: 1.0)
     * @throws core::ConfigurationException if capacity is 0 or the weight
     *         range is not 0 < min_weight <= max_weight
     */
    explicit LandmarkSmoothingBuffer(std::size_t capacity = 5,
                                     double min_weight = 0.3,
                                     double max_weight = 1.0);

    ~LandmarkSmoothingBuffer();

    // Disable copy, allow move
    LandmarkSmoothingBuffer(const LandmarkSmoothingBuffer&) = delete;
    LandmarkSmoothingBuffer& operator=(const LandmarkSmoothingBuffer&) = delete;
    LandmarkSmoothingBuffer(LandmarkSmoothingBuffer&&) noexcept;
    LandmarkSmoothingBuffer& operator=(LandmarkSmoothingBuffer&&) noexcept;

    /**
     * @brief Append a landmark set, evicting the oldest if full
     */
    void push(const LandmarkSet& landmarks);

    /**
     * @brief Weighted average of the buffered sets
     *
     * Each landmark index is averaged independently over the buffered sets
     * that contain it, with weights renormalized over those sets. Averages
     * are rounded to the nearest pixel and clamped to @p bounds.
     *
     * @param bounds Frame size used for clamping (empty size = no clamping)
     * @return std::nullopt when empty; the buffered set unchanged when only
     *         one set is buffered; otherwise the smoothed set ordered by index
     */
    std::optional<LandmarkSet> smoothed(const cv::Size& bounds = cv::Size()) const;

    std::size_t size() const;
    std::size_t capacity() const;
    bool is_full() const;
    bool is_empty() const;
    void clear();

    /**
     * @brief Get set at index (0 = oldest, size()-1 = newest)
     * @throws std::out_of_range if index >= size()
     */
    const LandmarkSet& get_frame_at(std::size_t index) const;

    /**
     * @brief Get the @p count most recent sets (oldest first)
     *
     * @param count Number of sets to retrieve (0 = all)
     */
    std::vector<LandmarkSet> get_recent_frames(std::size_t count = 0) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;  ///< PIMPL idiom for implementation hiding
};

/**
 * @brief Fixed-capacity FIFO of 2D positions with weighted smoothing
 *
 * Same window and weighting rules as LandmarkSmoothingBuffer, applied to a
 * single point of interest (fingertip or palm center).
 */
class PositionSmoothingBuffer {
public:
    explicit PositionSmoothingBuffer(std::size_t capacity = 5,
                                     double min_weight = 0.3,
                                     double max_weight = 1.0);

    ~PositionSmoothingBuffer();

    PositionSmoothingBuffer(const PositionSmoothingBuffer&) = delete;
    PositionSmoothingBuffer& operator=(const PositionSmoothingBuffer&) = delete;
    PositionSmoothingBuffer(PositionSmoothingBuffer&&) noexcept;
    PositionSmoothingBuffer& operator=(PositionSmoothingBuffer&&) noexcept;

    void push(const cv::Point& position);

    /**
     * @brief Weighted average of the buffered positions
     *
     * @return std::nullopt when empty; the raw position when only one is
     *         buffered; otherwise the rounded, clamped average
     */
    std::optional<cv::Point> smoothed(const cv::Size& bounds = cv::Size()) const;

    std::size_t size() const;
    std::size_t capacity() const;
    bool is_full() const;
    bool is_empty() const;
    void clear();

    /**
     * @brief Get position at index (0 = oldest)
     * @throws std::out_of_range if index >= size()
     */
    cv::Point get_frame_at(std::size_t index) const;

    /**
     * @brief Get the @p count most recent positions (oldest first)
     *
     * @param count Number of positions (0 = all)
     */
    std::vector<cv::Point> get_recent_positions(std::size_t count = 0) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace gesture
} // namespace handcal

#endif // HANDCAL_GESTURE_TEMPORAL_BUFFER_HPP

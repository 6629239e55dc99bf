/**
 * @file TemporalBuffer.cpp
 * @brief Implementation of the landmark and position smoothing buffers
 */

#include "handcal/gesture/TemporalBuffer.hpp"
#include "handcal/gesture/HandGeometry.hpp"
#include <handcal/core/exception.hpp>
#include <deque>
#include <map>
#include <stdexcept>
#include <cmath>

namespace handcal {
namespace gesture {

namespace {

void validate_window(std::size_t capacity, double min_weight, double max_weight) {
    if (capacity == 0) {
        HANDCAL_THROW(core::ConfigurationException, "Smoothing buffer capacity must be positive");
    }
    if (!(min_weight > 0.0) || !(max_weight >= min_weight)) {
        HANDCAL_THROW(core::ConfigurationException,
                      "Smoothing weights must satisfy 0 < min_weight <= max_weight");
    }
}

/**
 * @brief Bounded FIFO shared by both buffer implementations
 */
template<typename T>
struct BoundedWindow {
    std::deque<T> items;
    std::size_t max_capacity;
    double min_weight;
    double max_weight;

    BoundedWindow(std::size_t capacity, double min_w, double max_w)
        : max_capacity(capacity), min_weight(min_w), max_weight(max_w) {
        validate_window(capacity, min_w, max_w);
    }

    void push(const T& item) {
        if (items.size() >= max_capacity) {
            items.pop_front();  // Remove oldest
        }
        items.push_back(item);
    }

    const T& at(std::size_t index) const {
        if (index >= items.size()) {
            throw std::out_of_range("Frame index out of range");
        }
        return items[index];
    }

    std::vector<T> recent(std::size_t count) const {
        std::size_t n = (count == 0 || count > items.size()) ? items.size() : count;
        return std::vector<T>(items.end() - static_cast<std::ptrdiff_t>(n), items.end());
    }

    std::vector<double> weights() const {
        return compute_recency_weights(items.size(), min_weight, max_weight);
    }
};

int round_to_pixel(double value) {
    return static_cast<int>(std::lround(value));
}

} // namespace

std::vector<double> compute_recency_weights(std::size_t count,
                                            double min_weight,
                                            double max_weight) {
    std::vector<double> weights;
    if (count == 0) {
        return weights;
    }

    weights.reserve(count);
    if (count == 1) {
        weights.push_back(1.0);
        return weights;
    }

    double total = 0.0;
    const double step = (max_weight - min_weight) / static_cast<double>(count - 1);
    for (std::size_t i = 0; i < count; ++i) {
        double w = min_weight + step * static_cast<double>(i);
        weights.push_back(w);
        total += w;
    }

    for (auto& w : weights) {
        w /= total;
    }
    return weights;
}

// ===== LandmarkSmoothingBuffer =====

/**
 * @brief PIMPL implementation for LandmarkSmoothingBuffer
 */
class LandmarkSmoothingBuffer::Impl {
public:
    BoundedWindow<LandmarkSet> window;

    Impl(std::size_t capacity, double min_w, double max_w)
        : window(capacity, min_w, max_w) {}

    std::optional<LandmarkSet> smoothed(const cv::Size& bounds) const {
        if (window.items.empty()) {
            return std::nullopt;
        }
        if (window.items.size() == 1) {
            return window.items.back();
        }

        struct Accumulator {
            double x = 0.0;
            double y = 0.0;
            double weight = 0.0;
        };

        const std::vector<double> weights = window.weights();
        std::map<int, Accumulator> per_index;

        for (std::size_t j = 0; j < window.items.size(); ++j) {
            for (const auto& lm : window.items[j]) {
                Accumulator& acc = per_index[lm.index];
                acc.x += lm.position.x * weights[j];
                acc.y += lm.position.y * weights[j];
                acc.weight += weights[j];
            }
        }

        LandmarkSet result;
        result.reserve(per_index.size());
        for (const auto& entry : per_index) {
            const Accumulator& acc = entry.second;
            // Renormalize over the sets that actually contain this index
            cv::Point avg(round_to_pixel(acc.x / acc.weight),
                          round_to_pixel(acc.y / acc.weight));
            result.emplace_back(entry.first, clamp_to_frame(avg, bounds));
        }
        return result;
    }
};

LandmarkSmoothingBuffer::LandmarkSmoothingBuffer(std::size_t capacity,
                                                 double min_weight,
                                                 double max_weight)
    : pImpl(std::make_unique<Impl>(capacity, min_weight, max_weight)) {
}

LandmarkSmoothingBuffer::~LandmarkSmoothingBuffer() = default;

LandmarkSmoothingBuffer::LandmarkSmoothingBuffer(LandmarkSmoothingBuffer&&) noexcept = default;
LandmarkSmoothingBuffer& LandmarkSmoothingBuffer::operator=(LandmarkSmoothingBuffer&&) noexcept = default;

void LandmarkSmoothingBuffer::push(const LandmarkSet& landmarks) {
    pImpl->window.push(landmarks);
}

std::optional<LandmarkSet> LandmarkSmoothingBuffer::smoothed(const cv::Size& bounds) const {
    return pImpl->smoothed(bounds);
}

std::size_t LandmarkSmoothingBuffer::size() const {
    return pImpl->window.items.size();
}

std::size_t LandmarkSmoothingBuffer::capacity() const {
    return pImpl->window.max_capacity;
}

bool LandmarkSmoothingBuffer::is_full() const {
    return pImpl->window.items.size() >= pImpl->window.max_capacity;
}

bool LandmarkSmoothingBuffer::is_empty() const {
    return pImpl->window.items.empty();
}

void LandmarkSmoothingBuffer::clear() {
    pImpl->window.items.clear();
}

const LandmarkSet& LandmarkSmoothingBuffer::get_frame_at(std::size_t index) const {
    return pImpl->window.at(index);
}

std::vector<LandmarkSet> LandmarkSmoothingBuffer::get_recent_frames(std::size_t count) const {
    return pImpl->window.recent(count);
}

// ===== PositionSmoothingBuffer =====

/**
 * @brief PIMPL implementation for PositionSmoothingBuffer
 */
class PositionSmoothingBuffer::Impl {
public:
    BoundedWindow<cv::Point> window;

    Impl(std::size_t capacity, double min_w, double max_w)
        : window(capacity, min_w, max_w) {}

    std::optional<cv::Point> smoothed(const cv::Size& bounds) const {
        if (window.items.empty()) {
            return std::nullopt;
        }
        if (window.items.size() == 1) {
            return window.items.back();
        }

        const std::vector<double> weights = window.weights();
        double avg_x = 0.0;
        double avg_y = 0.0;
        for (std::size_t i = 0; i < window.items.size(); ++i) {
            avg_x += window.items[i].x * weights[i];
            avg_y += window.items[i].y * weights[i];
        }

        return clamp_to_frame(cv::Point(round_to_pixel(avg_x), round_to_pixel(avg_y)), bounds);
    }
};

PositionSmoothingBuffer::PositionSmoothingBuffer(std::size_t capacity,
                                                 double min_weight,
                                                 double max_weight)
    : pImpl(std::make_unique<Impl>(capacity, min_weight, max_weight)) {
}

PositionSmoothingBuffer::~PositionSmoothingBuffer() = default;

PositionSmoothingBuffer::PositionSmoothingBuffer(PositionSmoothingBuffer&&) noexcept = default;
PositionSmoothingBuffer& PositionSmoothingBuffer::operator=(PositionSmoothingBuffer&&) noexcept = default;

void PositionSmoothingBuffer::push(const cv::Point& position) {
    pImpl->window.push(position);
}

std::optional<cv::Point> PositionSmoothingBuffer::smoothed(const cv::Size& bounds) const {
    return pImpl->smoothed(bounds);
}

std::size_t PositionSmoothingBuffer::size() const {
    return pImpl->window.items.size();
}

std::size_t PositionSmoothingBuffer::capacity() const {
    return pImpl->window.max_capacity;
}

bool PositionSmoothingBuffer::is_full() const {
    return pImpl->window.items.size() >= pImpl->window.max_capacity;
}

bool PositionSmoothingBuffer::is_empty() const {
    return pImpl->window.items.empty();
}

void PositionSmoothingBuffer::clear() {
    pImpl->window.items.clear();
}

cv::Point PositionSmoothingBuffer::get_frame_at(std::size_t index) const {
    return pImpl->window.at(index);
}

std::vector<cv::Point> PositionSmoothingBuffer::get_recent_positions(std::size_t count) const {
    return pImpl->window.recent(count);
}

} // namespace gesture
} // namespace handcal

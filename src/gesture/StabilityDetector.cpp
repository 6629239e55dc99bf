/**
 * @file StabilityDetector.cpp
 * @brief Implementation of landmark/position stability checks
 */

#include "handcal/gesture/StabilityDetector.hpp"
#include "handcal/gesture/HandGeometry.hpp"
#include <handcal/core/exception.hpp>
#include <algorithm>

namespace handcal {
namespace gesture {

std::optional<double> mean_displacement(const LandmarkSet& first, const LandmarkSet& last) {
    double total = 0.0;
    int matched = 0;

    for (const auto& lm : first) {
        auto other = find_landmark(last, lm.index);
        if (!other) {
            continue;
        }
        total += distance(lm.position, *other);
        ++matched;
    }

    if (matched == 0) {
        return std::nullopt;
    }
    return total / matched;
}

bool is_stable(const std::vector<LandmarkSet>& window, double threshold) {
    if (window.size() < 2) {
        return false;
    }

    auto displacement = mean_displacement(window.front(), window.back());
    if (!displacement) {
        return false;
    }
    return *displacement < threshold;
}

std::optional<PositionVariance> compute_position_variance(const std::vector<cv::Point>& positions,
                                                          std::size_t window) {
    if (window == 0 || positions.size() < window) {
        return std::nullopt;
    }

    auto begin = positions.end() - static_cast<std::ptrdiff_t>(window);
    const double n = static_cast<double>(window);

    double mean_x = 0.0;
    double mean_y = 0.0;
    for (auto it = begin; it != positions.end(); ++it) {
        mean_x += it->x;
        mean_y += it->y;
    }
    mean_x /= n;
    mean_y /= n;

    PositionVariance variance;
    for (auto it = begin; it != positions.end(); ++it) {
        variance.var_x += (it->x - mean_x) * (it->x - mean_x);
        variance.var_y += (it->y - mean_y) * (it->y - mean_y);
    }
    variance.var_x /= n;
    variance.var_y /= n;
    return variance;
}

bool is_position_stable(const std::vector<cv::Point>& positions,
                        double threshold,
                        std::size_t window) {
    auto variance = compute_position_variance(positions, window);
    if (!variance) {
        return false;
    }
    return variance->var_x < threshold && variance->var_y < threshold;
}

StabilityCounter::StabilityCounter(int score_cap)
    : score_cap_(score_cap) {
    if (score_cap <= 0) {
        HANDCAL_THROW(core::ConfigurationException, "Stability score cap must be positive");
    }
}

void StabilityCounter::record(bool stable) {
    last_verdict_ = stable;
    if (stable) {
        ++count_;
    } else {
        count_ = std::max(0, count_ - 1);
    }
}

void StabilityCounter::reset() {
    count_ = 0;
    last_verdict_ = false;
}

int StabilityCounter::score() const {
    const int capped = std::min(count_, score_cap_);
    return capped * 100 / score_cap_;
}

} // namespace gesture
} // namespace handcal

/**
 * @file HandTrackingSession.cpp
 * @brief Implementation of the per-hand tracking session
 */

#include "handcal/gesture/HandTrackingSession.hpp"
#include "handcal/gesture/HandGeometry.hpp"
#include "handcal/gesture/StabilityDetector.hpp"
#include "handcal/gesture/TemporalBuffer.hpp"
#include <handcal/core/Logger.hpp>
#include <handcal/core/exception.hpp>
#include <deque>

namespace handcal {
namespace gesture {

namespace {

const TrackingConfig& validated(const TrackingConfig& config) {
    if (!config.is_valid()) {
        HANDCAL_THROW(core::ConfigurationException, "Invalid tracking configuration");
    }
    return config;
}

} // namespace

/**
 * @brief PIMPL implementation for HandTrackingSession
 */
class HandTrackingSession::Impl {
public:
    TrackingConfig config;
    LandmarkSmoothingBuffer landmark_buffer;
    PositionSmoothingBuffer position_buffer;
    StabilityCounter counter;

    // Smoothed outputs of the most recent frames, for the stability check
    std::deque<LandmarkSet> recent_smoothed;

    std::optional<LandmarkSet> last_smoothed;
    std::optional<cv::Point> last_point;
    std::optional<double> hand_size_reference;

    explicit Impl(const TrackingConfig& cfg)
        : config(validated(cfg))
        , landmark_buffer(cfg.buffer_capacity, cfg.min_weight, cfg.max_weight)
        , position_buffer(cfg.buffer_capacity, cfg.min_weight, cfg.max_weight)
        , counter(cfg.stability_score_cap) {}

    std::optional<cv::Point> extract_point(const LandmarkSet& smoothed) const {
        switch (config.point_of_interest) {
            case PointOfInterest::INDEX_TIP:
                if (smoothed.size() < 9) {
                    return std::nullopt;
                }
                return find_landmark(smoothed, LandmarkIndex::INDEX_TIP);
            case PointOfInterest::PALM_CENTER:
                return hand_center(smoothed);
        }
        return std::nullopt;
    }

    void handle_dropout() {
        if (counter.count() > 0) {
            HANDCAL_LOG_DEBUG("HandTrackingSession")
                << "Hand lost, stability counter reset from " << counter.count();
        }
        counter.reset();
    }

    HandTrackingResult process(const LandmarkSet& raw, const cv::Size& bounds) {
        HandTrackingResult result;
        result.hand_detected = true;

        landmark_buffer.push(clamp_to_frame(raw, bounds));

        auto smoothed = landmark_buffer.smoothed(bounds);
        if (!smoothed) {
            return result;
        }

        recent_smoothed.push_back(*smoothed);
        while (recent_smoothed.size() > config.stability_window) {
            recent_smoothed.pop_front();
        }

        if (landmark_buffer.size() >= config.stability_window &&
            recent_smoothed.size() >= config.stability_window) {
            const bool was_stable = counter.last_verdict();
            const std::vector<LandmarkSet> window(recent_smoothed.begin(), recent_smoothed.end());
            const bool stable = is_stable(window, config.landmark_stability_threshold);
            counter.record(stable);

            if (stable != was_stable) {
                HANDCAL_LOG_DEBUG("HandTrackingSession")
                    << (stable ? "Hand became stable" : "Hand moving")
                    << " (score " << counter.score() << ")";
            }

            result.stability_evaluated = true;
            result.is_stable = stable;
        }

        if (auto point = extract_point(*smoothed)) {
            position_buffer.push(*point);
            last_point = position_buffer.smoothed(bounds);
        } else {
            last_point.reset();
        }

        last_smoothed = std::move(*smoothed);
        result.smoothed_landmarks = last_smoothed;
        result.point_of_interest = last_point;
        result.stability_score = counter.score();
        return result;
    }

    void reset() {
        landmark_buffer.clear();
        position_buffer.clear();
        counter.reset();
        recent_smoothed.clear();
        last_smoothed.reset();
        last_point.reset();
    }
};

HandTrackingSession::HandTrackingSession()
    : HandTrackingSession(TrackingConfig()) {
}

HandTrackingSession::HandTrackingSession(const TrackingConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
}

HandTrackingSession::~HandTrackingSession() = default;

HandTrackingSession::HandTrackingSession(HandTrackingSession&&) noexcept = default;
HandTrackingSession& HandTrackingSession::operator=(HandTrackingSession&&) noexcept = default;

HandTrackingResult HandTrackingSession::process_frame(const std::optional<LandmarkSet>& landmarks,
                                                      const cv::Size& frame_bounds) {
    if (!landmarks || landmarks->empty()) {
        pImpl->handle_dropout();
        return HandTrackingResult();
    }
    return pImpl->process(*landmarks, frame_bounds);
}

void HandTrackingSession::calibrate(const LandmarkSet& landmarks) {
    pImpl->hand_size_reference = hand_size(landmarks);
    HANDCAL_LOG_INFO("HandTrackingSession")
        << "Hand size reference set to " << *pImpl->hand_size_reference << " px";
}

void HandTrackingSession::clear_calibration() {
    pImpl->hand_size_reference.reset();
}

std::optional<double> HandTrackingSession::hand_size_reference() const {
    return pImpl->hand_size_reference;
}

std::optional<double> HandTrackingSession::normalize(double measurement) const {
    if (!pImpl->hand_size_reference || *pImpl->hand_size_reference <= 0.0) {
        return std::nullopt;
    }
    return measurement / *pImpl->hand_size_reference;
}

std::optional<LandmarkSet> HandTrackingSession::smoothed_landmarks() const {
    return pImpl->last_smoothed;
}

std::optional<cv::Point> HandTrackingSession::point_of_interest() const {
    return pImpl->last_point;
}

int HandTrackingSession::stability_score() const {
    return pImpl->counter.score();
}

bool HandTrackingSession::is_stable() const {
    return pImpl->counter.last_verdict();
}

bool HandTrackingSession::is_hand_stable(std::optional<double> threshold) const {
    return is_position_stable(pImpl->position_buffer.get_recent_positions(),
                              threshold.value_or(pImpl->config.position_stability_threshold),
                              pImpl->config.stability_window);
}

void HandTrackingSession::reset() {
    pImpl->reset();
}

std::size_t HandTrackingSession::buffered_frames() const {
    return pImpl->landmark_buffer.size();
}

TrackingConfig HandTrackingSession::get_config() const {
    return pImpl->config;
}

// ===== MultiHandTracker =====

MultiHandTracker::MultiHandTracker(std::size_t max_hands, const TrackingConfig& config) {
    if (max_hands == 0) {
        HANDCAL_THROW(core::ConfigurationException, "MultiHandTracker needs at least one hand slot");
    }
    sessions_.reserve(max_hands);
    for (std::size_t i = 0; i < max_hands; ++i) {
        sessions_.emplace_back(config);
    }
}

std::vector<HandTrackingResult> MultiHandTracker::process_frame(const std::vector<LandmarkSet>& hands,
                                                                const cv::Size& frame_bounds) {
    std::vector<HandTrackingResult> results;
    results.reserve(sessions_.size());

    for (std::size_t slot = 0; slot < sessions_.size(); ++slot) {
        if (slot < hands.size()) {
            results.push_back(sessions_[slot].process_frame(hands[slot], frame_bounds));
        } else {
            results.push_back(sessions_[slot].process_frame(std::nullopt, frame_bounds));
        }
    }
    return results;
}

HandTrackingSession& MultiHandTracker::session(std::size_t slot) {
    return sessions_.at(slot);
}

const HandTrackingSession& MultiHandTracker::session(std::size_t slot) const {
    return sessions_.at(slot);
}

void MultiHandTracker::reset() {
    for (auto& s : sessions_) {
        s.reset();
    }
}

} // namespace gesture
} // namespace handcal

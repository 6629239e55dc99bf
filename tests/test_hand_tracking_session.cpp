/**
 * @file test_hand_tracking_session.cpp
 * @brief Unit tests for the per-hand tracking session
 *
 * Validates:
 * - Per-frame contract (clamp, smooth, stability, point of interest)
 * - Stability score growth to 100 and decay on motion
 * - Dropout handling (counter reset, buffers untouched)
 * - Calibration reference surviving reset()
 * - Multi-hand slot independence
 */

#include <gtest/gtest.h>
#include <handcal/gesture/HandTrackingSession.hpp>
#include <handcal/core/exception.hpp>
#include <handcal/core/Logger.hpp>
#include <stdexcept>

using namespace handcal::gesture;

class HandTrackingSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        handcal::core::Logger::getInstance().setLevel(handcal::core::LogLevel::WARNING);
        session_ = std::make_unique<HandTrackingSession>();
    }

    void TearDown() override {
        session_.reset();
    }

    /// Hand with wrist at (x, y) and a 100 px wrist-to-middle-MCP span
    static LandmarkSet hand_at(int x, int y) {
        std::vector<cv::Point> points;
        for (int i = 0; i < static_cast<int>(HAND_LANDMARK_COUNT); ++i) {
            points.emplace_back(x + (i % 5) * 4, y - i * 8);
        }
        points[LandmarkIndex::WRIST] = cv::Point(x, y);
        points[LandmarkIndex::MIDDLE_MCP] = cv::Point(x, y - 100);
        return make_landmark_set(points);
    }

    const cv::Size bounds_{640, 480};
    std::unique_ptr<HandTrackingSession> session_;
};

/**
 * Test 1: Stability is not evaluated until three smoothed sets exist
 */
TEST_F(HandTrackingSessionTest, WarmUp) {
    const LandmarkSet hand = hand_at(300, 400);

    auto first = session_->process_frame(hand, bounds_);
    EXPECT_TRUE(first.hand_detected);
    EXPECT_FALSE(first.stability_evaluated);
    ASSERT_TRUE(first.smoothed_landmarks.has_value());
    EXPECT_EQ(*first.smoothed_landmarks, hand);

    auto second = session_->process_frame(hand, bounds_);
    EXPECT_FALSE(second.stability_evaluated);
    EXPECT_EQ(second.stability_score, 0);

    auto third = session_->process_frame(hand, bounds_);
    EXPECT_TRUE(third.stability_evaluated);
    EXPECT_TRUE(third.is_stable);
    EXPECT_EQ(third.stability_score, 10);
}

/**
 * Test 2: A motionless hand reaches a score of exactly 100
 */
TEST_F(HandTrackingSessionTest, StillHandReachesFullScore) {
    const LandmarkSet hand = hand_at(300, 400);

    HandTrackingResult result;
    for (int i = 0; i < 12; ++i) {
        result = session_->process_frame(hand, bounds_);
    }

    // Frames 3..12 were evaluated
    EXPECT_EQ(result.stability_score, 100);
    EXPECT_TRUE(result.is_stable);
    EXPECT_TRUE(session_->is_stable());
    EXPECT_EQ(session_->stability_score(), 100);

    for (int i = 0; i < 5; ++i) {
        result = session_->process_frame(hand, bounds_);
    }
    EXPECT_EQ(result.stability_score, 100);
}

/**
 * Test 3: A sweeping hand never becomes stable
 */
TEST_F(HandTrackingSessionTest, MovingHandUnstable) {
    for (int i = 0; i < 15; ++i) {
        auto result = session_->process_frame(hand_at(100 + i * 25, 400), bounds_);
        if (result.stability_evaluated) {
            EXPECT_FALSE(result.is_stable) << "frame " << i;
        }
        EXPECT_EQ(result.stability_score, 0);
    }
}

/**
 * Test 4: Motion after rest decays the score one step per frame
 */
TEST_F(HandTrackingSessionTest, ScoreDecaysOnMotion) {
    const LandmarkSet hand = hand_at(300, 400);
    for (int i = 0; i < 7; ++i) {
        session_->process_frame(hand, bounds_);
    }
    ASSERT_EQ(session_->stability_score(), 50);

    session_->process_frame(hand_at(200, 400), bounds_);
    session_->process_frame(hand_at(100, 400), bounds_);
    EXPECT_LT(session_->stability_score(), 50);
    EXPECT_FALSE(session_->is_stable());
}

/**
 * Test 5: Dropout zeroes the counter and leaves buffers alone
 */
TEST_F(HandTrackingSessionTest, DropoutResetsCounter) {
    const LandmarkSet hand = hand_at(300, 400);
    for (int i = 0; i < 6; ++i) {
        session_->process_frame(hand, bounds_);
    }
    ASSERT_EQ(session_->stability_score(), 40);
    const std::size_t buffered = session_->buffered_frames();

    auto lost = session_->process_frame(std::nullopt, bounds_);
    EXPECT_FALSE(lost.hand_detected);
    EXPECT_FALSE(lost.smoothed_landmarks.has_value());
    EXPECT_EQ(lost.stability_score, 0);
    EXPECT_EQ(session_->stability_score(), 0);
    EXPECT_EQ(session_->buffered_frames(), buffered);

    // An empty set is also a dropout
    session_->process_frame(LandmarkSet(), bounds_);
    EXPECT_EQ(session_->buffered_frames(), buffered);

    // History is intact, so the next frame is evaluated straight away
    auto back = session_->process_frame(hand, bounds_);
    EXPECT_TRUE(back.stability_evaluated);
    EXPECT_EQ(back.stability_score, 10);
}

/**
 * Test 6: Input is clamped into the frame before smoothing
 */
TEST_F(HandTrackingSessionTest, ClampsToFrame) {
    LandmarkSet hand = hand_at(300, 400);
    hand[LandmarkIndex::INDEX_TIP].position = cv::Point(-50, 900);

    auto result = session_->process_frame(hand, bounds_);
    ASSERT_TRUE(result.smoothed_landmarks.has_value());
    EXPECT_EQ((*result.smoothed_landmarks)[LandmarkIndex::INDEX_TIP].position, cv::Point(0, 479));

    ASSERT_TRUE(result.point_of_interest.has_value());
    EXPECT_EQ(*result.point_of_interest, cv::Point(0, 479));
}

/**
 * Test 7: Index fingertip is the default point of interest
 */
TEST_F(HandTrackingSessionTest, PointOfInterestIndexTip) {
    const LandmarkSet hand = hand_at(300, 400);
    for (int i = 0; i < 3; ++i) {
        session_->process_frame(hand, bounds_);
    }

    auto poi = session_->point_of_interest();
    ASSERT_TRUE(poi.has_value());
    EXPECT_EQ(*poi, hand[LandmarkIndex::INDEX_TIP].position);
    EXPECT_TRUE(session_->is_hand_stable());
}

/**
 * Test 8: Palm center can be tracked instead
 */
TEST_F(HandTrackingSessionTest, PointOfInterestPalmCenter) {
    TrackingConfig config;
    config.point_of_interest = PointOfInterest::PALM_CENTER;
    HandTrackingSession palm(config);

    auto result = palm.process_frame(hand_at(300, 400), bounds_);
    ASSERT_TRUE(result.point_of_interest.has_value());
    EXPECT_EQ(*result.point_of_interest, cv::Point(300, 350));
}

/**
 * Test 9: A short set still smooths but has no fingertip
 */
TEST_F(HandTrackingSessionTest, ShortSetWithoutFingertip) {
    LandmarkSet hand = hand_at(300, 400);
    hand.resize(6);

    auto result = session_->process_frame(hand, bounds_);
    EXPECT_TRUE(result.hand_detected);
    ASSERT_TRUE(result.smoothed_landmarks.has_value());
    EXPECT_EQ(result.smoothed_landmarks->size(), 6u);
    EXPECT_FALSE(result.point_of_interest.has_value());
}

/**
 * Test 10: Position stability needs three buffered positions
 */
TEST_F(HandTrackingSessionTest, HandStabilityNeedsHistory) {
    const LandmarkSet hand = hand_at(300, 400);
    session_->process_frame(hand, bounds_);
    session_->process_frame(hand, bounds_);
    EXPECT_FALSE(session_->is_hand_stable());

    session_->process_frame(hand, bounds_);
    EXPECT_TRUE(session_->is_hand_stable());
    EXPECT_TRUE(session_->is_hand_stable(0.5));
}

/**
 * Test 11: reset() clears buffers and score but keeps the hand size reference
 */
TEST_F(HandTrackingSessionTest, ResetKeepsCalibration) {
    const LandmarkSet hand = hand_at(300, 400);
    session_->calibrate(hand);
    ASSERT_TRUE(session_->hand_size_reference().has_value());
    EXPECT_DOUBLE_EQ(*session_->hand_size_reference(), 100.0);

    for (int i = 0; i < 5; ++i) {
        session_->process_frame(hand, bounds_);
    }
    session_->reset();

    EXPECT_EQ(session_->buffered_frames(), 0u);
    EXPECT_EQ(session_->stability_score(), 0);
    EXPECT_FALSE(session_->smoothed_landmarks().has_value());
    EXPECT_FALSE(session_->point_of_interest().has_value());
    EXPECT_FALSE(session_->is_hand_stable());

    ASSERT_TRUE(session_->hand_size_reference().has_value());
    auto normalized = session_->normalize(25.0);
    ASSERT_TRUE(normalized.has_value());
    EXPECT_DOUBLE_EQ(*normalized, 0.25);

    session_->clear_calibration();
    EXPECT_FALSE(session_->normalize(25.0).has_value());
}

/**
 * Test 12: Invalid configuration is rejected at construction
 */
TEST_F(HandTrackingSessionTest, InvalidConfig) {
    TrackingConfig config;
    config.buffer_capacity = 0;
    EXPECT_THROW(HandTrackingSession session(config), handcal::core::ConfigurationException);

    config = TrackingConfig();
    config.stability_window = 6;
    EXPECT_THROW(HandTrackingSession session(config), handcal::core::ConfigurationException);

    config = TrackingConfig();
    config.min_weight = 2.0;
    EXPECT_THROW(HandTrackingSession session(config), handcal::core::ConfigurationException);
}

/**
 * Test 13: Hands are tracked in independent slots
 */
TEST_F(HandTrackingSessionTest, MultiHandIndependence) {
    MultiHandTracker tracker(2);
    const LandmarkSet left = hand_at(150, 400);

    for (int i = 0; i < 4; ++i) {
        auto results = tracker.process_frame({left, hand_at(400 + i * 30, 400)}, bounds_);
        ASSERT_EQ(results.size(), 2u);
        EXPECT_TRUE(results[0].hand_detected);
        EXPECT_TRUE(results[1].hand_detected);
    }
    EXPECT_EQ(tracker.session(0).stability_score(), 20);
    EXPECT_EQ(tracker.session(1).stability_score(), 0);

    // Second hand leaves the frame
    auto results = tracker.process_frame({left}, bounds_);
    EXPECT_TRUE(results[0].hand_detected);
    EXPECT_FALSE(results[1].hand_detected);
    EXPECT_EQ(tracker.session(0).stability_score(), 30);

    EXPECT_THROW(tracker.session(2), std::out_of_range);
    EXPECT_THROW(MultiHandTracker(0), handcal::core::ConfigurationException);

    tracker.reset();
    EXPECT_EQ(tracker.session(0).buffered_frames(), 0u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

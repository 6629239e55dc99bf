/**
 * @file FingerStateClassifier.hpp
 * @brief Per-finger extended/flexed classification from landmark heights
 *
 * @copyright 2025 handcal Project
 * @license MIT License
 */

#ifndef HANDCAL_GESTURE_FINGER_STATE_CLASSIFIER_HPP
#define HANDCAL_GESTURE_FINGER_STATE_CLASSIFIER_HPP

#include "GestureTypes.hpp"

namespace handcal {
namespace gesture {

/**
 * @brief Tip and second-joint landmark indices used for one finger
 */
struct FingerJoints {
    Finger finger;
    int tip;
    int joint;
};

/// Tip/joint pairs: thumb (4,3), index (8,6), middle (12,10), ring (16,14), pinky (20,18)
extern const std::array<FingerJoints, 5> FINGER_JOINTS;

/**
 * @brief Classify each finger as extended or flexed
 *
 * A finger is extended when its tip is strictly above its second joint in
 * image coordinates (tip.y < joint.y).
 *
 * This heuristic is orientation dependent: it assumes the hand is roughly
 * upright and facing the camera. A sideways or inverted hand produces
 * meaningless flags, and the thumb (which bends sideways) is only reliable
 * when held upright. Callers must not rely on it beyond that pose range.
 *
 * @param landmarks Ordered landmark set
 * @return One entry per finger whose tip and joint indices are both present;
 *         empty for an empty set
 */
FingerStates classify_fingers(const LandmarkSet& landmarks);

/**
 * @brief Number of fingers flagged as extended
 */
int count_extended(const FingerStates& states);

} // namespace gesture
} // namespace handcal

#endif // HANDCAL_GESTURE_FINGER_STATE_CLASSIFIER_HPP

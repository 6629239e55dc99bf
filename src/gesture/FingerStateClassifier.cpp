/**
 * @file FingerStateClassifier.cpp
 * @brief Implementation of the tip-vs-joint finger classifier
 */

#include "handcal/gesture/FingerStateClassifier.hpp"

namespace handcal {
namespace gesture {

const std::array<FingerJoints, 5> FINGER_JOINTS = {{
    {Finger::THUMB,  LandmarkIndex::THUMB_TIP,  LandmarkIndex::THUMB_IP},
    {Finger::INDEX,  LandmarkIndex::INDEX_TIP,  LandmarkIndex::INDEX_PIP},
    {Finger::MIDDLE, LandmarkIndex::MIDDLE_TIP, LandmarkIndex::MIDDLE_PIP},
    {Finger::RING,   LandmarkIndex::RING_TIP,   LandmarkIndex::RING_PIP},
    {Finger::PINKY,  LandmarkIndex::PINKY_TIP,  LandmarkIndex::PINKY_PIP}
}};

FingerStates classify_fingers(const LandmarkSet& landmarks) {
    FingerStates states;

    for (const auto& joints : FINGER_JOINTS) {
        if (static_cast<std::size_t>(joints.tip) >= landmarks.size() ||
            static_cast<std::size_t>(joints.joint) >= landmarks.size()) {
            continue;
        }

        // Image Y grows downward: smaller Y = higher
        const int tip_y = landmarks[joints.tip].position.y;
        const int joint_y = landmarks[joints.joint].position.y;
        states[joints.finger] = tip_y < joint_y;
    }

    return states;
}

int count_extended(const FingerStates& states) {
    int count = 0;
    for (const auto& entry : states) {
        if (entry.second) {
            ++count;
        }
    }
    return count;
}

} // namespace gesture
} // namespace handcal

#pragma once

#include "Types.hpp"

namespace core {

/**
 * Extended-finger counter.
 *
 * Pure function of one hand's smoothed landmarks. The physical hand only
 * selects which lateral direction counts as "outward" for the thumb
 * (camera space, unmirrored image: right thumb extends toward +x).
 */
class GestureClassifier {
public:
    /**
     * Landmark indices for gesture detection
     * Based on MediaPipe Hand Landmark model
     */
    struct LandmarkIndices {
        // Thumb
        static constexpr int THUMB_TIP = 4;
        static constexpr int THUMB_IP = 3;
        static constexpr int THUMB_MCP = 2;
        static constexpr int THUMB_CMC = 1;

        // Index finger
        static constexpr int INDEX_TIP = 8;
        static constexpr int INDEX_PIP = 6;
        static constexpr int INDEX_MCP = 5;

        // Middle finger
        static constexpr int MIDDLE_TIP = 12;
        static constexpr int MIDDLE_PIP = 10;
        static constexpr int MIDDLE_MCP = 9;

        // Ring finger
        static constexpr int RING_TIP = 16;
        static constexpr int RING_PIP = 14;

        // Pinky
        static constexpr int PINKY_TIP = 20;
        static constexpr int PINKY_PIP = 18;

        // Wrist doubles as the palm-center reference
        static constexpr int WRIST = 0;
        static constexpr int PALM_CENTER = WRIST;
    };

    struct FingerState {
        bool thumb = false;
        bool index = false;
        bool middle = false;
        bool ring = false;
        bool pinky = false;

        [[nodiscard]] int count() const {
            return (thumb ? 1 : 0) + (index ? 1 : 0) + (middle ? 1 : 0) +
                   (ring ? 1 : 0) + (pinky ? 1 : 0);
        }
    };

    [[nodiscard]] FingerState classify(const LandmarkSet& landmarks, Hand hand) const;

    /**
     * @return extended finger count in [0,5]
     */
    [[nodiscard]] int countExtendedFingers(const LandmarkSet& landmarks, Hand hand) const {
        return classify(landmarks, hand).count();
    }

    [[nodiscard]] bool isFingerExtended(const LandmarkSet& landmarks, int tipIdx, int pipIdx) const;
    [[nodiscard]] bool isThumbExtended(const LandmarkSet& landmarks, Hand hand) const;

    // Interior angle at the thumb MCP, radians (pi == perfectly straight)
    [[nodiscard]] static float thumbMcpAngle(const LandmarkSet& landmarks);

private:
    [[nodiscard]] static float distance2D(const Landmark& a, const Landmark& b);
};

} // namespace core

#include "core/GestureClassifier.hpp"
#include <algorithm>
#include <cmath>

namespace core {

GestureClassifier::FingerState GestureClassifier::classify(const LandmarkSet& landmarks,
                                                           Hand hand) const {
    using LI = LandmarkIndices;

    FingerState state;
    state.thumb = isThumbExtended(landmarks, hand);
    state.index = isFingerExtended(landmarks, LI::INDEX_TIP, LI::INDEX_PIP);
    state.middle = isFingerExtended(landmarks, LI::MIDDLE_TIP, LI::MIDDLE_PIP);
    state.ring = isFingerExtended(landmarks, LI::RING_TIP, LI::RING_PIP);
    state.pinky = isFingerExtended(landmarks, LI::PINKY_TIP, LI::PINKY_PIP);
    return state;
}

bool GestureClassifier::isFingerExtended(const LandmarkSet& landmarks,
                                         int tipIdx, int pipIdx) const {
    const auto& tip = landmarks[tipIdx];
    const auto& pip = landmarks[pipIdx];
    const auto& palm = landmarks[LandmarkIndices::PALM_CENTER];

    // Image coordinates: y grows downward, so "above" means smaller y
    bool tipAbovePip = tip.y < pip.y - FINGER_TIP_MARGIN;

    // Tilted hands can put a curled tip above its PIP; a curled tip is
    // never meaningfully further from the palm than the PIP joint.
    bool tipFartherOut = distance2D(tip, palm) > distance2D(pip, palm) * FINGER_DISTANCE_RATIO;

    return tipAbovePip && tipFartherOut;
}

bool GestureClassifier::isThumbExtended(const LandmarkSet& landmarks, Hand hand) const {
    using LI = LandmarkIndices;
    const auto& tip = landmarks[LI::THUMB_TIP];
    const auto& mcp = landmarks[LI::THUMB_MCP];
    const auto& palm = landmarks[LI::PALM_CENTER];

    bool straight = thumbMcpAngle(landmarks) > THUMB_STRAIGHT_ANGLE;
    bool awayFromPalm = distance2D(tip, palm) > distance2D(mcp, palm) * THUMB_DISTANCE_RATIO;

    // Tip must sit on the outward side of the MCP for this hand
    float outward = (hand == Hand::Right) ? 1.0f : -1.0f;
    bool lateral = (tip.x - mcp.x) * outward > 0.0f;

    return straight && awayFromPalm && lateral;
}

float GestureClassifier::thumbMcpAngle(const LandmarkSet& landmarks) {
    using LI = LandmarkIndices;
    const auto& cmc = landmarks[LI::THUMB_CMC];
    const auto& mcp = landmarks[LI::THUMB_MCP];
    const auto& ip = landmarks[LI::THUMB_IP];

    float ax = cmc.x - mcp.x, ay = cmc.y - mcp.y, az = cmc.z - mcp.z;
    float bx = ip.x - mcp.x, by = ip.y - mcp.y, bz = ip.z - mcp.z;

    float lenA = std::sqrt(ax * ax + ay * ay + az * az);
    float lenB = std::sqrt(bx * bx + by * by + bz * bz);
    if (lenA < 1e-6f || lenB < 1e-6f) return 0.0f;  // Collapsed joint reads as bent

    float cosAngle = (ax * bx + ay * by + az * bz) / (lenA * lenB);
    return std::acos(std::clamp(cosAngle, -1.0f, 1.0f));
}

float GestureClassifier::distance2D(const Landmark& a, const Landmark& b) {
    float dx = a.x - b.x;
    float dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

} // namespace core

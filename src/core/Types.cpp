#include "core/Types.hpp"
#include <stdexcept>
#include <string>

namespace core {

const char* handName(Hand hand) {
    switch (hand) {
        case Hand::Left:  return "left";
        case Hand::Right: return "right";
        default: return "unknown";
    }
}

const char* modeName(Mode mode) {
    switch (mode) {
        case Mode::Idle:       return "idle";
        case Mode::Drawing:    return "drawing";
        case Mode::Hello:      return "hello";
        case Mode::Aruka:      return "aruka";
        case Mode::Lissajous:  return "lissajous";
        case Mode::Koch:       return "koch";
        case Mode::Catch:      return "catch";
        case Mode::Nebula:     return "nebula";
        case Mode::Basketball: return "basketball";
        default: return "unknown";
    }
}

void EngineConfig::validate() const {
    if (particleCount == 0) {
        throw std::invalid_argument("EngineConfig: particleCount must be > 0");
    }
    if (viewportWidth <= 0 || viewportHeight <= 0) {
        throw std::invalid_argument("EngineConfig: viewport must be positive, got " +
                                    std::to_string(viewportWidth) + "x" +
                                    std::to_string(viewportHeight));
    }
    if (minCutoff <= 0.0 || dCutoff <= 0.0 || beta < 0.0) {
        throw std::invalid_argument("EngineConfig: invalid One Euro parameters");
    }
    if (transitionStep <= 0.0f || transitionStep > 1.0f) {
        throw std::invalid_argument("EngineConfig: transitionStep must be in (0, 1]");
    }
    if (debounceFrames < 1) {
        throw std::invalid_argument("EngineConfig: debounceFrames must be >= 1");
    }
}

} // namespace core

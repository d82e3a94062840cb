#pragma once

#include <functional>
#include <optional>
#include <string>

#include "SimulationContext.hpp"
#include "TransitionController.hpp"

namespace core {

/**
 * Operating-mode FSM driven by the debounced finger counts of both hands.
 *
 * Priority (highest first):
 *   1. left == 5 && right == 5          -> Basketball
 *   2. left count change (edge)          -> Drawing/Hello/Aruka/Lissajous/Koch/Catch
 *   3. right == 5                        -> Nebula (targets scattered once, on entry)
 *
 * Leaving Basketball, or Nebula once the right hand drops below 5, falls
 * back to the left-hand table mode, else Nebula/Idle.
 * Shape modes issue exactly one generator call and one transition request
 * per entry.
 */
class ModeStateMachine {
public:
    struct ShapeFactory {
        std::function<ShapePointCloud(const std::string&)> text;
        std::function<ShapePointCloud(size_t)> lissajous;
        std::function<ShapePointCloud(int, size_t)> koch;

        // Bound to the shapes:: generators
        static ShapeFactory defaults();
    };

    using TransitionCallback = std::function<void(Mode from, Mode to)>;

    explicit ModeStateMachine(ShapeFactory factory = ShapeFactory::defaults());

    /**
     * Resolve the mode for this frame.
     * @param left  stable left count, nullopt if absent or not yet stable
     * @param right stable right count, nullopt if absent or not yet stable
     * @return the current mode
     */
    Mode update(SimulationContext& ctx, TransitionController& transitions,
                std::optional<int> left, std::optional<int> right);

    void reset();

    /**
     * Left-hand table: 0 drawing, 1 hello, 2 aruka, 3 lissajous, 4 koch, 5 catch.
     */
    [[nodiscard]] static Mode modeForLeftCount(int count);

    void setTransitionCallback(TransitionCallback callback) { transitionCallback_ = std::move(callback); }

private:
    void enter(Mode mode, SimulationContext& ctx, TransitionController& transitions);
    void fallback(SimulationContext& ctx, TransitionController& transitions,
                  std::optional<int> left, std::optional<int> right);
    void scatterNebula(SimulationContext& ctx);

    ShapeFactory factory_;
    TransitionCallback transitionCallback_;

    std::optional<int> lastLeft_;      // last known stable left count
    bool leftPresent_ = false;
};

} // namespace core

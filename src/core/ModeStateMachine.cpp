#include "core/ModeStateMachine.hpp"
#include "core/Logger.hpp"
#include "shapes/ShapeGenerator.hpp"

namespace core {

namespace {
constexpr Rgb HELLO_COLOR{0.0f, 1.0f, 1.0f};
constexpr Rgb ARUKA_COLOR{1.0f, 1.0f, 0.0f};
constexpr Rgb KOCH_COLOR{0.0f, 1.0f, 0.53f};
}

ModeStateMachine::ShapeFactory ModeStateMachine::ShapeFactory::defaults() {
    ShapeFactory factory;
    factory.text = [](const std::string& text) { return shapes::textCoordinates(text); };
    factory.lissajous = [](size_t count) { return shapes::lissajous(count); };
    factory.koch = [](int iterations, size_t count) { return shapes::kochSnowflake(iterations, count); };
    return factory;
}

ModeStateMachine::ModeStateMachine(ShapeFactory factory)
    : factory_(std::move(factory)) {
}

void ModeStateMachine::reset() {
    lastLeft_.reset();
    leftPresent_ = false;
}

Mode ModeStateMachine::modeForLeftCount(int count) {
    switch (count) {
        case 0: return Mode::Drawing;
        case 1: return Mode::Hello;
        case 2: return Mode::Aruka;
        case 3: return Mode::Lissajous;
        case 4: return Mode::Koch;
        case 5: return Mode::Catch;
        default: return Mode::Idle;
    }
}

Mode ModeStateMachine::update(SimulationContext& ctx, TransitionController& transitions,
                              std::optional<int> left, std::optional<int> right) {
    // An absent or unstable left hand keeps its last known count, so a
    // dropout alone is not a count change. Returning to a different mode
    // than the table entry re-enters it.
    const bool leftEdge = left &&
        (left != lastLeft_ || (!leftPresent_ && modeForLeftCount(*left) != ctx.mode));
    if (left) lastLeft_ = left;
    leftPresent_ = left.has_value();

    // 1. Compound gesture wins regardless of the current mode
    if (left == 5 && right == 5) {
        if (ctx.mode != Mode::Basketball) {
            enter(Mode::Basketball, ctx, transitions);
        }
        return ctx.mode;
    }

    if (ctx.mode == Mode::Basketball) {
        fallback(ctx, transitions, left, right);
        return ctx.mode;
    }

    // 2. Left-hand table, edge-triggered
    if (left && leftEdge) {
        enter(modeForLeftCount(*left), ctx, transitions);
    }
    // 3. Right hand held fully open
    else if (right == 5 && ctx.mode != Mode::Nebula) {
        enter(Mode::Nebula, ctx, transitions);
    }
    else if (ctx.mode == Mode::Nebula && right != 5) {
        fallback(ctx, transitions, left, right);
    }

    return ctx.mode;
}

void ModeStateMachine::fallback(SimulationContext& ctx, TransitionController& transitions,
                                std::optional<int> left, std::optional<int> right) {
    if (left) {
        enter(modeForLeftCount(*left), ctx, transitions);
    } else if (right == 5) {
        enter(Mode::Nebula, ctx, transitions);
    } else {
        enter(Mode::Idle, ctx, transitions);
    }
}

void ModeStateMachine::enter(Mode mode, SimulationContext& ctx, TransitionController& transitions) {
    const Mode from = ctx.mode;
    ctx.mode = mode;

    const size_t count = ctx.particles.size();
    switch (mode) {
        case Mode::Hello:
            transitions.requestTransition(ctx, factory_.text("Hello"), HELLO_COLOR);
            break;
        case Mode::Aruka:
            transitions.requestTransition(ctx, factory_.text("aruka"), ARUKA_COLOR);
            break;
        case Mode::Lissajous:
            transitions.requestTransition(ctx, factory_.lissajous(count));
            break;
        case Mode::Koch:
            transitions.requestTransition(ctx, factory_.koch(KOCH_ITERATIONS, count), KOCH_COLOR);
            break;
        case Mode::Nebula:
            scatterNebula(ctx);
            break;
        default:
            // Drawing, Catch, Basketball and Idle targets are procedural
            break;
    }

    Logger::info("Mode: ", modeName(from), " → ", modeName(mode));

    if (transitionCallback_) {
        transitionCallback_(from, mode);
    }
}

void ModeStateMachine::scatterNebula(SimulationContext& ctx) {
    std::uniform_real_distribution<float> unit(-0.5f, 0.5f);
    auto& targets = ctx.particles.targets;
    for (size_t i = 0; i < ctx.particles.size(); ++i) {
        const size_t i3 = i * 3;
        targets[i3] = unit(ctx.rng) * NEBULA_SCATTER_X;
        targets[i3 + 1] = unit(ctx.rng) * NEBULA_SCATTER_Y;
        targets[i3 + 2] = unit(ctx.rng) * NEBULA_SCATTER_Z;
    }
}

} // namespace core

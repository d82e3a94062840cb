#include "core/Engine.hpp"
#include "core/Logger.hpp"
#include "core/Types.hpp"
#include "net/OscReceiver.hpp"
#include "net/PreviewServer.hpp"
#include "render/PreviewRenderer.hpp"
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <string>

// Global flag for shutdown
std::atomic<bool> g_running{true};

void signalHandler(int signum) {
    core::Logger::info("Interrupt signal (", signum, ") received. Shutting down...");
    g_running = false;
}

int main() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const char* debugEnv = std::getenv("HAND_PARTICLES_DEBUG");
    if (debugEnv && std::string(debugEnv) != "0") {
        core::Logger::setLevel(core::LogLevel::DEBUG);
    }

    core::Logger::info("Starting HandParticles...");

    // Configuration Constants
    const std::string OSC_PORT = "9000";
    const int PREVIEW_PORT = 8080;
    const double TARGET_FPS = 60.0;
    const auto FRAME_PERIOD = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / TARGET_FPS));
    const auto TRACKER_TIMEOUT = std::chrono::milliseconds(1000);

    using Clock = std::chrono::steady_clock;
    const auto epoch = Clock::now();
    auto secondsSinceStart = [epoch](Clock::time_point t) {
        return std::chrono::duration<double>(t - epoch).count();
    };

    // Outer Loop for auto-restart
    while (g_running) {
        try {
            // 1. Engine
            core::EngineConfig config;
            config.particleCount = core::PARTICLE_COUNT;
            config.viewportWidth = core::VIEWPORT_WIDTH;
            config.viewportHeight = core::VIEWPORT_HEIGHT;
            config.mirrorHandedness = true;     // MediaPipe selfie labels
            core::Engine engine(config);

            // 2. Tracker input
            net::OscReceiver receiver(OSC_PORT);
            receiver.start();

            // 3. Preview (optional, service keeps running without it)
            render::PreviewRenderer::Config previewConfig;
            render::PreviewRenderer renderer(previewConfig);
            net::PreviewServer preview(PREVIEW_PORT);
            if (!preview.start()) {
                core::Logger::warn("Preview stream disabled.");
            }

            engine.modes().setTransitionCallback([](core::Mode from, core::Mode to) {
                core::Logger::debug("Transition callback: ", core::modeName(from), " -> ", core::modeName(to));
            });

            core::Logger::info("Service running. Press Ctrl+C to exit.");

            auto lastFrame = Clock::now();
            auto lastTrackerUpdate = lastFrame;
            bool handsVisible = false;

            // Main loop: poll -> submit -> tick -> render, fixed pacing
            while (g_running) {
                const auto frameStart = Clock::now();

                if (auto hands = receiver.poll()) {
                    handsVisible = !hands->empty();
                    engine.submitHands(*hands, secondsSinceStart(frameStart));
                    lastTrackerUpdate = frameStart;
                } else if (handsVisible && frameStart - lastTrackerUpdate > TRACKER_TIMEOUT) {
                    core::Logger::warn("No tracker data for ",
                                       std::chrono::duration_cast<std::chrono::milliseconds>(TRACKER_TIMEOUT).count(),
                                       "ms, releasing hands");
                    engine.submitHands({}, secondsSinceStart(frameStart));
                    handsVisible = false;
                }

                const double dt = std::chrono::duration<double>(frameStart - lastFrame).count();
                lastFrame = frameStart;
                engine.tick(dt);

                if (preview.isRunning() && preview.clientCount() > 0) {
                    preview.publish(renderer.render(engine));
                }

                std::this_thread::sleep_until(frameStart + FRAME_PERIOD);
            }

            core::Logger::info("Stopping modules...");
            preview.stop();
            receiver.stop();

        } catch (const std::exception& e) {
            core::Logger::error("Fatal error in service loop: ", e.what());
            if (g_running) {
                core::Logger::info("Retrying in 5 seconds...");
                std::this_thread::sleep_for(std::chrono::seconds(5));
            }
        }
    }

    core::Logger::info("Service stopped cleanly.");
    return 0;
}

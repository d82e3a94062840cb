#pragma once

#include <optional>
#include <string>
#include <vector>
#include <lo/lo.h>

#include "core/Types.hpp"

namespace net {

/**
 * OSC input of hand tracker results.
 *
 * Polled from the render loop (no thread of its own). Understands:
 *   /hands/frame  i count, then per hand: s handedness, f confidence, b landmarks
 *   /hands/none   (no arguments)
 * The landmark blob carries 21 x (x, y, z) little-endian float32.
 */
class OscReceiver {
public:
    static constexpr const char* FRAME_PATH = "/hands/frame";
    static constexpr const char* NONE_PATH = "/hands/none";

    /**
     * @param port UDP port; empty lets liblo choose a free one
     */
    explicit OscReceiver(const std::string& port);
    ~OscReceiver();

    OscReceiver(const OscReceiver&) = delete;
    OscReceiver& operator=(const OscReceiver&) = delete;

    /**
     * Bind the UDP server. Throws std::runtime_error if the port cannot be bound.
     */
    void start();
    void stop();

    /**
     * Drain every datagram that is already waiting.
     * @return the most recent hand update, nullopt if none arrived
     */
    std::optional<std::vector<core::HandFrame>> poll();

    /**
     * Decode a /hands/frame message.
     * @return nullopt if the type tags or blob sizes do not match
     */
    static std::optional<std::vector<core::HandFrame>> decodeFrame(lo_message msg);

    [[nodiscard]] int port() const;
    [[nodiscard]] bool isRunning() const { return _server != nullptr; }
    [[nodiscard]] uint64_t droppedMessages() const { return _dropped; }

private:
    static int frameHandler(const char* path, const char* types, lo_arg** argv,
                            int argc, lo_message msg, void* userData);
    static int noneHandler(const char* path, const char* types, lo_arg** argv,
                           int argc, lo_message msg, void* userData);
    static void errorHandler(int num, const char* msg, const char* where);

    std::string _port;
    lo_server _server = nullptr;

    std::optional<std::vector<core::HandFrame>> _latest;
    uint64_t _dropped = 0;
};

} // namespace net

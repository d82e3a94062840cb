#include "net/OscReceiver.hpp"
#include "core/Logger.hpp"

#include <cstring>
#include <stdexcept>

namespace net {

namespace {
constexpr size_t LANDMARK_BLOB_BYTES = core::LANDMARK_COUNT * 3 * sizeof(float);
}

OscReceiver::OscReceiver(const std::string& port) : _port(port) {
}

OscReceiver::~OscReceiver() {
    stop();
}

void OscReceiver::start() {
    if (_server) return;

    _server = lo_server_new(_port.empty() ? nullptr : _port.c_str(), &OscReceiver::errorHandler);
    if (!_server) {
        throw std::runtime_error("OscReceiver: failed to bind UDP port " + _port);
    }

    lo_server_add_method(_server, FRAME_PATH, nullptr, &OscReceiver::frameHandler, this);
    lo_server_add_method(_server, NONE_PATH, nullptr, &OscReceiver::noneHandler, this);

    core::Logger::info("OscReceiver listening on UDP ", port());
}

void OscReceiver::stop() {
    if (!_server) return;
    lo_server_free(_server);
    _server = nullptr;
    core::Logger::info("OscReceiver stopped.");
}

int OscReceiver::port() const {
    return _server ? lo_server_get_port(_server) : -1;
}

std::optional<std::vector<core::HandFrame>> OscReceiver::poll() {
    _latest.reset();
    if (!_server) return std::nullopt;

    // Non-blocking drain; the last update of the batch wins
    while (lo_server_recv_noblock(_server, 0) > 0) {
    }

    auto result = std::move(_latest);
    _latest.reset();
    return result;
}

std::optional<std::vector<core::HandFrame>> OscReceiver::decodeFrame(lo_message msg) {
    if (!msg) return std::nullopt;

    const char* types = lo_message_get_types(msg);
    lo_arg** argv = lo_message_get_argv(msg);
    const int argc = lo_message_get_argc(msg);

    if (!types || argc < 1 || types[0] != LO_INT32) return std::nullopt;

    const int count = argv[0]->i;
    if (count < 0 || count > static_cast<int>(core::HAND_COUNT)) return std::nullopt;
    if (argc != 1 + count * 3) return std::nullopt;

    std::vector<core::HandFrame> frames;
    frames.reserve(static_cast<size_t>(count));

    for (int h = 0; h < count; ++h) {
        const int base = 1 + h * 3;
        if (types[base] != LO_STRING || types[base + 1] != LO_FLOAT || types[base + 2] != LO_BLOB) {
            return std::nullopt;
        }

        lo_blob blob = reinterpret_cast<lo_blob>(argv[base + 2]);
        if (lo_blob_datasize(blob) != static_cast<uint32_t>(LANDMARK_BLOB_BYTES)) {
            return std::nullopt;
        }

        float raw[core::LANDMARK_COUNT * 3];
        std::memcpy(raw, lo_blob_dataptr(blob), LANDMARK_BLOB_BYTES);

        core::HandFrame frame;
        frame.handedness = &argv[base]->s;
        frame.confidence = argv[base + 1]->f;
        frame.landmarks.resize(core::LANDMARK_COUNT);
        for (size_t i = 0; i < core::LANDMARK_COUNT; ++i) {
            frame.landmarks[i] = {raw[i * 3], raw[i * 3 + 1], raw[i * 3 + 2]};
        }
        frames.push_back(std::move(frame));
    }

    return frames;
}

int OscReceiver::frameHandler(const char* /*path*/, const char* /*types*/, lo_arg** /*argv*/,
                              int /*argc*/, lo_message msg, void* userData) {
    auto* self = static_cast<OscReceiver*>(userData);
    auto frames = decodeFrame(msg);
    if (!frames) {
        if (self->_dropped++ % 100 == 0) {
            core::Logger::warn("OscReceiver: malformed ", FRAME_PATH, " message (",
                               self->_dropped, " dropped so far)");
        }
        return 0;
    }
    self->_latest = std::move(*frames);
    return 0;
}

int OscReceiver::noneHandler(const char* /*path*/, const char* /*types*/, lo_arg** /*argv*/,
                             int /*argc*/, lo_message /*msg*/, void* userData) {
    auto* self = static_cast<OscReceiver*>(userData);
    self->_latest = std::vector<core::HandFrame>{};
    return 0;
}

void OscReceiver::errorHandler(int num, const char* msg, const char* where) {
    core::Logger::error("OscReceiver: liblo error ", num, ": ", msg ? msg : "",
                        " (", where ? where : "-", ")");
}

} // namespace net

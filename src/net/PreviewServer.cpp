#include "net/PreviewServer.hpp"
#include "core/Logger.hpp"

#include <opencv2/imgcodecs.hpp>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>

namespace net {

namespace {

constexpr int ACCEPT_POLL_MS = 200;
constexpr auto FRAME_WAIT = std::chrono::milliseconds(500);

bool sendAll(int socket, const void* data, size_t size) {
    const auto* bytes = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t sent = ::send(socket, bytes, size, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        bytes += sent;
        size -= static_cast<size_t>(sent);
    }
    return true;
}

} // namespace

PreviewServer::PreviewServer(int port, int jpegQuality)
    : _port(port), _jpegQuality(jpegQuality) {
}

PreviewServer::~PreviewServer() {
    stop();
}

bool PreviewServer::start() {
    if (_running) return true;

    _listenSocket = ::socket(AF_INET, SOCK_STREAM, 0);
    if (_listenSocket < 0) {
        core::Logger::error("PreviewServer: socket() failed: ", std::strerror(errno));
        return false;
    }

    int opt = 1;
    if (::setsockopt(_listenSocket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        core::Logger::warn("PreviewServer: SO_REUSEADDR failed: ", std::strerror(errno));
    }

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(static_cast<uint16_t>(_port));

    if (::bind(_listenSocket, reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0 ||
        ::listen(_listenSocket, 4) < 0) {
        core::Logger::error("PreviewServer: cannot listen on port ", _port, ": ", std::strerror(errno));
        ::close(_listenSocket);
        _listenSocket = -1;
        return false;
    }

    _running = true;
    _acceptThread = std::thread(&PreviewServer::acceptLoop, this);
    core::Logger::info("PreviewServer streaming on http://0.0.0.0:", _port, "/");
    return true;
}

void PreviewServer::stop() {
    if (!_running) return;
    _running = false;
    _frameCv.notify_all();

    if (_acceptThread.joinable()) {
        _acceptThread.join();
    }
    if (_listenSocket >= 0) {
        ::close(_listenSocket);
        _listenSocket = -1;
    }

    std::list<std::shared_ptr<Client>> clients;
    {
        std::lock_guard<std::mutex> lock(_clientsMutex);
        clients.swap(_clients);
    }
    for (auto& client : clients) {
        ::shutdown(client->socket, SHUT_RDWR);
        if (client->thread.joinable()) {
            client->thread.join();
        }
        ::close(client->socket);
    }

    core::Logger::info("PreviewServer stopped.");
}

void PreviewServer::publish(const cv::Mat& frame) {
    if (!_running || frame.empty()) return;

    reapClients();
    if (clientCount() == 0) return;

    std::vector<uchar> jpeg;
    try {
        cv::imencode(".jpg", frame, jpeg, {cv::IMWRITE_JPEG_QUALITY, _jpegQuality});
    } catch (const cv::Exception& e) {
        core::Logger::error("PreviewServer: JPEG encoding failed: ", e.what());
        return;
    }

    {
        std::lock_guard<std::mutex> lock(_frameMutex);
        _jpeg = std::move(jpeg);
        _sequence++;
    }
    _frameCv.notify_all();
}

size_t PreviewServer::clientCount() {
    std::lock_guard<std::mutex> lock(_clientsMutex);
    return _clients.size();
}

void PreviewServer::acceptLoop() {
    while (_running) {
        pollfd pfd{_listenSocket, POLLIN, 0};
        int ready = ::poll(&pfd, 1, ACCEPT_POLL_MS);
        if (ready < 0 && errno != EINTR) {
            core::Logger::warn("PreviewServer: poll failed: ", std::strerror(errno));
            continue;
        }
        if (ready <= 0) continue;

        int socket = ::accept(_listenSocket, nullptr, nullptr);
        if (socket < 0) {
            core::Logger::warn("PreviewServer: accept failed: ", std::strerror(errno));
            continue;
        }

        auto client = std::make_shared<Client>();
        client->socket = socket;
        client->thread = std::thread(&PreviewServer::streamTo, this, client);
        {
            std::lock_guard<std::mutex> lock(_clientsMutex);
            _clients.push_back(client);
        }
        core::Logger::info("PreviewServer: client connected (", clientCount(), " total)");
    }
}

void PreviewServer::streamTo(const std::shared_ptr<Client>& client) {
    // The request itself is not inspected; any GET gets the stream
    char request[1024];
    if (::recv(client->socket, request, sizeof(request), 0) <= 0) {
        client->done = true;
        return;
    }

    static const std::string header =
        "HTTP/1.1 200 OK\r\n"
        "Cache-Control: no-cache\r\n"
        "Connection: close\r\n"
        "Content-Type: multipart/x-mixed-replace; boundary=frame\r\n"
        "\r\n";
    if (!sendAll(client->socket, header.data(), header.size())) {
        client->done = true;
        return;
    }

    uint64_t lastSent = 0;
    while (_running) {
        std::vector<uchar> jpeg;
        {
            std::unique_lock<std::mutex> lock(_frameMutex);
            _frameCv.wait_for(lock, FRAME_WAIT, [&] { return _sequence != lastSent || !_running; });
            if (!_running) break;
            if (_sequence == lastSent) continue;
            jpeg = _jpeg;
            lastSent = _sequence;
        }

        std::ostringstream part;
        part << "--frame\r\n"
             << "Content-Type: image/jpeg\r\n"
             << "Content-Length: " << jpeg.size() << "\r\n\r\n";
        const std::string partHeader = part.str();

        if (!sendAll(client->socket, partHeader.data(), partHeader.size()) ||
            !sendAll(client->socket, jpeg.data(), jpeg.size()) ||
            !sendAll(client->socket, "\r\n", 2)) {
            break;
        }
    }

    client->done = true;
}

void PreviewServer::reapClients() {
    std::lock_guard<std::mutex> lock(_clientsMutex);
    for (auto it = _clients.begin(); it != _clients.end();) {
        if ((*it)->done) {
            if ((*it)->thread.joinable()) {
                (*it)->thread.join();
            }
            ::close((*it)->socket);
            core::Logger::info("PreviewServer: client disconnected");
            it = _clients.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace net

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <opencv2/core.hpp>

namespace net {

/**
 * MJPEG-over-HTTP preview stream (multipart/x-mixed-replace).
 *
 * publish() encodes once per frame; every connected client thread waits for
 * a newer frame sequence number and writes it. Slow clients skip frames.
 */
class PreviewServer {
public:
    explicit PreviewServer(int port = 8080, int jpegQuality = 80);
    ~PreviewServer();

    PreviewServer(const PreviewServer&) = delete;
    PreviewServer& operator=(const PreviewServer&) = delete;

    /**
     * @return false if the socket could not be bound (logged)
     */
    bool start();
    void stop();

    void publish(const cv::Mat& frame);

    [[nodiscard]] size_t clientCount();
    [[nodiscard]] bool isRunning() const { return _running; }

private:
    struct Client {
        int socket = -1;
        std::thread thread;
        std::atomic<bool> done{false};
    };

    void acceptLoop();
    void streamTo(const std::shared_ptr<Client>& client);
    void reapClients();

    int _port;
    int _jpegQuality;
    int _listenSocket = -1;
    std::atomic<bool> _running{false};
    std::thread _acceptThread;

    std::list<std::shared_ptr<Client>> _clients;
    std::mutex _clientsMutex;

    std::vector<uchar> _jpeg;
    uint64_t _sequence = 0;
    std::mutex _frameMutex;
    std::condition_variable _frameCv;
};

} // namespace net

#pragma once

#include "core/frame_protocol.hpp"
#include "core/socket_io.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace sttmon {
namespace core {

// Returns the status byte for the response
using FrameHandler = std::function<uint8_t(int32_t checkcode, int32_t requestCode,
                                           const std::string& payload)>;

/**
 * TCP listener for the frame protocol. Each client gets its own thread that
 * reads complete request frames, passes them to the handler and answers
 * with the configured response checkcode and the echoed request code.
 *
 * A failing client is reported and disconnected; the listener keeps running.
 */
class FrameServer {
public:
    FrameServer(std::string name, std::string host, int port,
                int32_t responseCheckcode, FrameHandler handler);
    ~FrameServer();
    
    FrameServer(const FrameServer&) = delete;
    FrameServer& operator=(const FrameServer&) = delete;
    
    // Binds and listens; throws NetworkException. Port 0 picks a free port.
    void start();
    // Closes the listener and all client connections, then joins every thread
    void stop();
    
    bool isRunning() const { return running_.load(); }
    // The bound port once started, the requested one before
    int getPort() const { return boundPort_.load(); }
    const std::string& getHost() const { return host_; }
    size_t getActiveClientCount() const;
    
private:
    struct ClientConnection {
        SocketHandle socket;
        std::string peer;
        std::thread thread;
        std::atomic<bool> finished{false};
    };
    
    void acceptLoop();
    void serveClient(ClientConnection* client);
    bool serveFrame(ClientConnection* client);
    void reapFinishedClients();
    
    std::string name_;
    std::string host_;
    std::atomic<int> boundPort_;
    int32_t responseCheckcode_;
    FrameHandler handler_;
    
    std::atomic<bool> running_{false};
    SocketHandle listener_;
    std::thread acceptThread_;
    
    mutable std::mutex clientsMutex_;
    std::list<std::unique_ptr<ClientConnection>> clients_;
};

} // namespace core
} // namespace sttmon

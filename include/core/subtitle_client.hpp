#pragma once

#include "core/frame_protocol.hpp"
#include "core/socket_io.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace sttmon {
namespace utils {
class JsonValue;
}

namespace core {

/**
 * Destination for recognized subtitle payloads
 */
class SubtitleSender {
public:
    virtual ~SubtitleSender() = default;
    virtual bool sendSubtitle(const std::string& text) = 0;
    virtual bool isConnected() const = 0;
};

using StatusCallback = std::function<void(const std::string&)>;

/**
 * Persistent connection to the subtitle output server.
 *
 * connect() is idempotent. Any send failure drops the connection so that the
 * next sendSubtitle() reconnects; failures are reported and returned, never
 * thrown.
 */
class SubtitleClient : public SubtitleSender {
public:
    SubtitleClient(std::string host, int port, int32_t checkcode,
                   int timeoutMs = 5000,
                   int32_t expectedResponseCheckcode = kSubtitleResponseCheckcode);
    ~SubtitleClient() override;
    
    bool connect();
    void disconnect();
    bool isConnected() const override;
    
    // Trims text and refuses empty input; true only for a status 0 answer
    bool sendSubtitle(const std::string& text) override;
    bool sendSubtitleJson(const utils::JsonValue& payload);
    
    void setStatusCallback(StatusCallback callback);
    
    const std::string& getHost() const { return host_; }
    int getPort() const { return port_; }

private:
    bool ensureConnectionLocked();
    void disconnectLocked();
    void log(const std::string& message) const;
    
    std::string host_;
    int port_;
    int32_t checkcode_;
    int timeoutMs_;
    int32_t expectedResponseCheckcode_;
    
    StatusCallback statusCallback_;
    SocketHandle socket_;
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace sttmon

#include "core/subtitle_client.hpp"
#include "utils/error_handler.hpp"
#include "utils/json_utils.hpp"
#include "utils/logging.hpp"
#include "utils/utf8_utils.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/time.h>
#include <utility>
#include <vector>

namespace sttmon {
namespace core {

namespace {

std::string hex(int32_t value) {
    std::ostringstream ss;
    ss << "0x" << std::hex << static_cast<uint32_t>(value);
    return ss.str();
}

void setTimeouts(int fd, int timeoutMs) {
    timeval tv{};
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

// Non-blocking connect bounded by timeoutMs; throws NetworkException
SocketHandle connectWithTimeout(const std::string& host, int port, int timeoutMs) {
    const std::string peer = describePeer(host, port);
    const std::string address = resolveIpv4(host);
    
    SocketHandle socket(::socket(AF_INET, SOCK_STREAM, 0));
    if (!socket.valid()) {
        throw utils::NetworkException("socket() failed", std::strerror(errno), peer);
    }
    
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    inet_pton(AF_INET, address.c_str(), &addr.sin_addr);
    
    int flags = fcntl(socket.get(), F_GETFL, 0);
    fcntl(socket.get(), F_SETFL, flags | O_NONBLOCK);
    
    int rc = ::connect(socket.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc < 0 && errno != EINPROGRESS) {
        throw utils::NetworkException("connect failed", std::strerror(errno), peer);
    }
    
    if (rc < 0) {
        pollfd pfd{};
        pfd.fd = socket.get();
        pfd.events = POLLOUT;
        int ready = ::poll(&pfd, 1, timeoutMs);
        if (ready <= 0) {
            throw utils::NetworkException("connect timed out", "", peer);
        }
        
        int error = 0;
        socklen_t len = sizeof(error);
        getsockopt(socket.get(), SOL_SOCKET, SO_ERROR, &error, &len);
        if (error != 0) {
            throw utils::NetworkException("connect failed", std::strerror(error), peer);
        }
    }
    
    fcntl(socket.get(), F_SETFL, flags);
    setTimeouts(socket.get(), timeoutMs);
    return socket;
}

} // namespace

SubtitleClient::SubtitleClient(std::string host, int port, int32_t checkcode,
                               int timeoutMs, int32_t expectedResponseCheckcode)
    : host_(std::move(host))
    , port_(port)
    , checkcode_(checkcode)
    , timeoutMs_(timeoutMs)
    , expectedResponseCheckcode_(expectedResponseCheckcode) {
}

SubtitleClient::~SubtitleClient() {
    disconnect();
}

void SubtitleClient::setStatusCallback(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    statusCallback_ = std::move(callback);
}

void SubtitleClient::log(const std::string& message) const {
    std::string line = "[SUBTITLE] " + message;
    utils::Logger::info(line);
    if (statusCallback_) {
        statusCallback_(line);
    }
}

bool SubtitleClient::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ensureConnectionLocked();
}

bool SubtitleClient::ensureConnectionLocked() {
    if (socket_.valid()) {
        return true;
    }
    
    try {
        socket_ = connectWithTimeout(host_, port_, timeoutMs_);
        log("connected to " + describePeer(host_, port_));
        return true;
    } catch (const utils::NetworkException& e) {
        utils::ErrorInfo info = e.getErrorInfo();
        info.category = utils::ErrorCategory::SUBTITLE;
        utils::ErrorHandler::getInstance().reportError(info);
        log(std::string("connect fail: ") + e.what());
        return false;
    }
}

void SubtitleClient::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnectLocked();
}

void SubtitleClient::disconnectLocked() {
    if (socket_.valid()) {
        socket_.close();
        log("disconnected");
    }
}

bool SubtitleClient::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return socket_.valid();
}

bool SubtitleClient::sendSubtitle(const std::string& text) {
    const std::string trimmed = utils::trim(text);
    if (trimmed.empty()) {
        return false;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensureConnectionLocked()) {
        return false;
    }
    
    try {
        std::vector<uint8_t> request = FrameCodec::encodeRequest(checkcode_, kRequestSubtitle, trimmed);
        sendAll(socket_.get(), request.data(), request.size());
        
        uint8_t responseBytes[kResponseSize];
        size_t got = recvExact(socket_.get(), responseBytes, sizeof(responseBytes));
        if (got < sizeof(responseBytes)) {
            throw utils::NetworkException("socket closed while receiving", "",
                                          describePeer(host_, port_));
        }
        
        FrameResponse response = FrameCodec::decodeResponse(responseBytes, sizeof(responseBytes));
        if (response.checkcode != expectedResponseCheckcode_) {
            log("invalid resp_checkcode: " + hex(response.checkcode) +
                " (expected " + hex(expectedResponseCheckcode_) + ")");
            return false;
        }
        if (response.requestCode != kRequestSubtitle) {
            log("mismatched resp_code: " + std::to_string(response.requestCode) +
                " (expected " + std::to_string(kRequestSubtitle) + ")");
            return false;
        }
        if (response.status != kStatusOk) {
            log("server returned error status=" + std::to_string(response.status));
            return false;
        }
        
        utils::Logger::debug("[SUBTITLE] subtitle sent OK (len=" + std::to_string(trimmed.size()) + ")");
        return true;
        
    } catch (const utils::SttMonException& e) {
        HANDLE_ERROR(utils::ErrorCategory::SUBTITLE, utils::ErrorSeverity::WARNING,
                     "Subtitle send failed", e.what());
        log(std::string("send_subtitle error: ") + e.what() + ", will reconnect next time");
        disconnectLocked();
        return false;
    }
}

bool SubtitleClient::sendSubtitleJson(const utils::JsonValue& payload) {
    std::string text;
    try {
        text = utils::JsonParser::stringify(payload);
    } catch (const std::exception& e) {
        log(std::string("json encoding error: ") + e.what());
        return false;
    }
    return sendSubtitle(text);
}

} // namespace core
} // namespace sttmon

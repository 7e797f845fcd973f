#include "core/frame_server.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace sttmon {
namespace core {

namespace {
constexpr int kAcceptPollTimeoutMs = 1000;
constexpr int kListenBacklog = 5;
}

FrameServer::FrameServer(std::string name, std::string host, int port,
                         int32_t responseCheckcode, FrameHandler handler)
    : name_(std::move(name))
    , host_(std::move(host))
    , boundPort_(port)
    , responseCheckcode_(responseCheckcode)
    , handler_(std::move(handler)) {
}

FrameServer::~FrameServer() {
    stop();
}

void FrameServer::start() {
    if (running_.load()) {
        utils::Logger::warn(name_ + " already running on port " + std::to_string(getPort()));
        return;
    }
    
    const std::string address = resolveIpv4(host_);
    
    SocketHandle listener(::socket(AF_INET, SOCK_STREAM, 0));
    if (!listener.valid()) {
        throw utils::NetworkException("socket() failed", std::strerror(errno));
    }
    
    int reuse = 1;
    setsockopt(listener.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
    
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(boundPort_.load()));
    inet_pton(AF_INET, address.c_str(), &addr.sin_addr);
    
    if (::bind(listener.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw utils::NetworkException("bind failed", std::strerror(errno),
                                      describePeer(host_, boundPort_.load()));
    }
    if (::listen(listener.get(), kListenBacklog) < 0) {
        throw utils::NetworkException("listen failed", std::strerror(errno),
                                      describePeer(host_, boundPort_.load()));
    }
    
    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (getsockname(listener.get(), reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0) {
        boundPort_ = ntohs(bound.sin_port);
    }
    
    listener_ = std::move(listener);
    running_ = true;
    acceptThread_ = std::thread(&FrameServer::acceptLoop, this);
    
    utils::Logger::info(name_ + " listening on " + describePeer(host_, getPort()));
}

void FrameServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    
    // Wake poll() right away instead of waiting for its timeout
    listener_.shutdown();
    if (acceptThread_.joinable()) {
        acceptThread_.join();
    }
    listener_.close();
    
    std::list<std::unique_ptr<ClientConnection>> clients;
    {
        std::lock_guard<std::mutex> lock(clientsMutex_);
        for (auto& client : clients_) {
            client->socket.shutdown();
        }
        clients.swap(clients_);
    }
    for (auto& client : clients) {
        if (client->thread.joinable()) {
            client->thread.join();
        }
    }
    
    utils::Logger::info(name_ + " stopped");
}

size_t FrameServer::getActiveClientCount() const {
    std::lock_guard<std::mutex> lock(clientsMutex_);
    size_t active = 0;
    for (const auto& client : clients_) {
        if (!client->finished.load()) {
            ++active;
        }
    }
    return active;
}

void FrameServer::acceptLoop() {
    while (running_.load()) {
        reapFinishedClients();
        
        pollfd pfd{};
        pfd.fd = listener_.get();
        pfd.events = POLLIN;
        
        int ready = ::poll(&pfd, 1, kAcceptPollTimeoutMs);
        if (!running_.load()) {
            break;
        }
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            HANDLE_ERROR(utils::ErrorCategory::NETWORK, utils::ErrorSeverity::ERROR,
                         name_ + " poll failed", std::strerror(errno));
            break;
        }
        if (ready == 0 || !(pfd.revents & POLLIN)) {
            continue;
        }
        
        sockaddr_in peerAddr{};
        socklen_t peerLen = sizeof(peerAddr);
        int fd = ::accept(listener_.get(), reinterpret_cast<sockaddr*>(&peerAddr), &peerLen);
        if (fd < 0) {
            if (errno != EINTR && errno != EAGAIN && running_.load()) {
                utils::Logger::warn(name_ + " accept failed: " + std::strerror(errno));
            }
            continue;
        }
        
        char peerIp[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &peerAddr.sin_addr, peerIp, sizeof(peerIp));
        
        auto client = std::make_unique<ClientConnection>();
        client->socket = SocketHandle(fd);
        client->peer = describePeer(peerIp, ntohs(peerAddr.sin_port));
        
        ClientConnection* raw = client.get();
        std::lock_guard<std::mutex> lock(clientsMutex_);
        clients_.push_back(std::move(client));
        raw->thread = std::thread(&FrameServer::serveClient, this, raw);
    }
}

void FrameServer::reapFinishedClients() {
    std::list<std::unique_ptr<ClientConnection>> finished;
    {
        std::lock_guard<std::mutex> lock(clientsMutex_);
        for (auto it = clients_.begin(); it != clients_.end();) {
            if ((*it)->finished.load()) {
                finished.push_back(std::move(*it));
                it = clients_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& client : finished) {
        if (client->thread.joinable()) {
            client->thread.join();
        }
    }
}

void FrameServer::serveClient(ClientConnection* client) {
    utils::ErrorContext context(name_, client->peer);
    utils::Logger::info("[CLIENT] connected from " + client->peer);
    
    try {
        while (running_.load() && serveFrame(client)) {
        }
    } catch (const utils::SttMonException& e) {
        utils::ErrorHandler::getInstance().reportError(e, name_, client->peer);
    } catch (const std::exception& e) {
        HANDLE_ERROR(utils::ErrorCategory::NETWORK, utils::ErrorSeverity::WARNING,
                     "Client connection failed", e.what());
    }
    
    client->socket.shutdown();
    utils::Logger::info("[CLIENT] disconnected: " + client->peer);
    client->finished = true;
}

bool FrameServer::serveFrame(ClientConnection* client) {
    const int fd = client->socket.get();
    
    uint8_t headerBytes[kRequestHeaderSize];
    size_t got = recvExact(fd, headerBytes, sizeof(headerBytes));
    if (got == 0) {
        return false;
    }
    if (got < sizeof(headerBytes)) {
        utils::Logger::debug(name_ + ": " + client->peer + " closed inside a frame header");
        return false;
    }
    
    FrameHeader header = FrameCodec::decodeHeader(headerBytes, sizeof(headerBytes));
    
    std::string payload(static_cast<size_t>(header.dataSize), '\0');
    if (header.dataSize > 0) {
        got = recvExact(fd, reinterpret_cast<uint8_t*>(&payload[0]), payload.size());
        if (got < payload.size()) {
            throw utils::NetworkException("client closed mid-transfer",
                                          std::to_string(got) + "/" + std::to_string(payload.size()),
                                          client->peer);
        }
    }
    
    uint8_t status = kStatusOk;
    try {
        status = handler_(header.checkcode, header.requestCode, payload);
    } catch (const std::exception& e) {
        HANDLE_EXCEPTION(e, name_ + " frame handler");
        status = kStatusError;
    }
    
    std::vector<uint8_t> response = FrameCodec::encodeResponse(responseCheckcode_,
                                                               header.requestCode, status);
    sendAll(fd, response.data(), response.size());
    return true;
}

} // namespace core
} // namespace sttmon

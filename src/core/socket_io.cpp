#include "core/socket_io.hpp"
#include "utils/error_handler.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace sttmon {
namespace core {

SocketHandle& SocketHandle::operator=(SocketHandle&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.release();
    }
    return *this;
}

int SocketHandle::release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

void SocketHandle::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void SocketHandle::shutdown() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

void sendAll(int fd, const uint8_t* data, size_t size) {
    size_t sent = 0;
    while (sent < size) {
        ssize_t n = ::send(fd, data + sent, size - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw utils::NetworkException("send failed", std::strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

size_t recvExact(int fd, uint8_t* buffer, size_t size) {
    size_t received = 0;
    while (received < size) {
        ssize_t n = ::recv(fd, buffer + received, size - received, 0);
        if (n == 0) {
            break;
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw utils::NetworkException("receive timed out");
            }
            throw utils::NetworkException("recv failed", std::strerror(errno));
        }
        received += static_cast<size_t>(n);
    }
    return received;
}

std::string resolveIpv4(const std::string& host) {
    in_addr addr{};
    if (inet_pton(AF_INET, host.c_str(), &addr) == 1) {
        return host;
    }
    
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    
    addrinfo* result = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (rc != 0 || result == nullptr) {
        throw utils::NetworkException("Cannot resolve host", gai_strerror(rc), host);
    }
    
    char buffer[INET_ADDRSTRLEN] = {0};
    const auto* ipv4 = reinterpret_cast<const sockaddr_in*>(result->ai_addr);
    inet_ntop(AF_INET, &ipv4->sin_addr, buffer, sizeof(buffer));
    freeaddrinfo(result);
    return buffer;
}

std::string describePeer(const std::string& address, int port) {
    return address + ":" + std::to_string(port);
}

} // namespace core
} // namespace sttmon

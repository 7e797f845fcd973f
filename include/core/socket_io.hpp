#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sttmon {
namespace core {

/**
 * Owning wrapper for a POSIX socket descriptor. Move-only; closes on
 * destruction.
 */
class SocketHandle {
public:
    SocketHandle() = default;
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle() { close(); }
    
    SocketHandle(SocketHandle&& other) noexcept : fd_(other.release()) {}
    SocketHandle& operator=(SocketHandle&& other) noexcept;
    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;
    
    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release();
    void close();
    // Wakes any thread blocked on the socket without releasing the descriptor
    void shutdown();

private:
    int fd_ = -1;
};

// Throws NetworkException on a socket error
void sendAll(int fd, const uint8_t* data, size_t size);

/**
 * Reads exactly size bytes unless the peer closes first. Returns the number
 * of bytes read, which is less than size only on orderly shutdown. Throws
 * NetworkException on a socket error or receive timeout.
 */
size_t recvExact(int fd, uint8_t* buffer, size_t size);

// Resolves host to an IPv4 address; throws NetworkException on failure
std::string resolveIpv4(const std::string& host);

std::string describePeer(const std::string& address, int port);

} // namespace core
} // namespace sttmon

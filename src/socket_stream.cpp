// src/socket_stream.cpp
// Socket-backed stream and plain TCP connect.

#include "apns/socket_stream.hpp"
#include "apns/error.hpp"

#include <cstring>

// POSIX sockets
#include <sys/time.h>
#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>
#include <poll.h>

namespace apns {

namespace {

void parse_endpoint(const std::string& endpoint, std::string& host, uint16_t& port) {
    auto colon = endpoint.rfind(':');
    if (colon == std::string::npos) {
        throw ApnsError::configuration("endpoint must be host:port, got: " + endpoint);
    }
    host = endpoint.substr(0, colon);
    int port_int = 0;
    try {
        port_int = std::stoi(endpoint.substr(colon + 1));
    } catch (const std::exception&) {
        throw ApnsError::configuration("endpoint port is not a valid number: " + endpoint);
    }
    if (port_int <= 0 || port_int > 65535) {
        throw ApnsError::configuration("endpoint port must be 1-65535, got: " + std::to_string(port_int));
    }
    port = static_cast<uint16_t>(port_int);
}

void configure_socket(int fd) {
    int nodelay = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    int keepalive = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
}

// Non-blocking connect bounded by timeout; returns the fd or -1.
int connect_with_timeout(const struct addrinfo* rp, std::chrono::milliseconds timeout) {
    int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (fd < 0) return -1;

    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        ::close(fd);
        return -1;
    }
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int ret = ::connect(fd, rp->ai_addr, rp->ai_addrlen);
    if (ret != 0) {
        if (errno != EINPROGRESS) {
            ::close(fd);
            return -1;
        }

        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        if (::poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0) {
            ::close(fd);
            return -1;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        if (so_error != 0) {
            ::close(fd);
            return -1;
        }
    }

    // Connected; restore blocking mode
    ::fcntl(fd, F_SETFL, flags);
    return fd;
}

} // namespace

SocketStream::SocketStream(int fd) : fd_(fd) {
    if (fd_ < 0) {
        throw ApnsError::configuration("socket descriptor is invalid");
    }
}

SocketStream::~SocketStream() {
    close();
    ::close(fd_);
}

std::unique_ptr<SocketStream> SocketStream::connect(const std::string& endpoint,
                                                    std::chrono::milliseconds timeout) {
    std::string host;
    uint16_t port = 0;
    parse_endpoint(endpoint, host, port);

    struct addrinfo hints{}, *res = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    auto port_str = std::to_string(port);
    int err = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0 || res == nullptr) {
        throw ApnsError::network("DNS resolution failed for " + host);
    }

    // Try each resolved address (IPv6/IPv4) until one connects.
    int fd = -1;
    for (struct addrinfo* rp = res; rp != nullptr && fd < 0; rp = rp->ai_next) {
        fd = connect_with_timeout(rp, timeout);
    }
    ::freeaddrinfo(res);

    if (fd < 0) {
        throw ApnsError::network("connect failed to " + endpoint);
    }
    configure_socket(fd);
    return std::make_unique<SocketStream>(fd);
}

bool SocketStream::write_all(const uint8_t* data, size_t len) {
    if (closed_.load()) return false;

    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

void SocketStream::read_exact(uint8_t* data, size_t len) {
    size_t got = 0;
    while (got < len) {
        if (closed_.load()) {
            throw ApnsError::closed("stream closed locally");
        }
        ssize_t n = ::recv(fd_, data + got, len - got, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n == 0) {
            throw ApnsError::closed(closed_.load() ? "stream closed locally"
                                                   : "stream closed by peer");
        }
        if (n < 0) {
            if (closed_.load()) {
                throw ApnsError::closed("stream closed locally");
            }
            throw ApnsError::io(std::strerror(errno));
        }
        got += static_cast<size_t>(n);
    }
}

void SocketStream::close() noexcept {
    // shutdown() rather than close() so a blocked recv() returns; the
    // descriptor is released in the destructor.
    if (!closed_.exchange(true)) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

} // namespace apns

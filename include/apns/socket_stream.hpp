// include/apns/socket_stream.hpp
// Stream over a connected POSIX socket.

#pragma once

#include "stream.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace apns {

class SocketStream : public Stream {
public:
    // Adopt an already-connected socket descriptor.
    explicit SocketStream(int fd);
    ~SocketStream() override;

    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    // Open a plain TCP connection to "host:port". Throws ApnsError.
    static std::unique_ptr<SocketStream> connect(const std::string& endpoint,
                                                 std::chrono::milliseconds timeout);

    bool write_all(const uint8_t* data, size_t len) override;
    void read_exact(uint8_t* data, size_t len) override;
    void close() noexcept override;

    int fd() const noexcept { return fd_; }
    bool closed() const noexcept { return closed_.load(); }

private:
    int fd_ = -1;
    std::atomic<bool> closed_{false};
};

} // namespace apns

// src/error_listener.hpp
// Background reader waiting for the peer's single error response.

#pragma once

#include "apns/stream.hpp"
#include "apns/types.hpp"

#include <functional>
#include <memory>
#include <thread>

namespace spdlog {
class logger;
}

namespace apns {

// Blocks on a 6-byte read from the stream and converts the outcome into one
// ErrorEvent handed to the sink: the peer's reply, or a Shutdown event when
// the read fails (EOF, I/O error, or a local close).
class ErrorListener {
public:
    using Sink = std::function<void(ErrorEvent)>;

    ErrorListener(Stream& stream, Sink sink, std::shared_ptr<spdlog::logger> logger);
    ~ErrorListener();

    ErrorListener(const ErrorListener&) = delete;
    ErrorListener& operator=(const ErrorListener&) = delete;

    // Wait for the read to finish. The stream must be closed first if no
    // reply is coming.
    void join();

private:
    void run();

    Stream& stream_;
    Sink sink_;
    std::shared_ptr<spdlog::logger> logger_;
    std::thread thread_;
};

} // namespace apns

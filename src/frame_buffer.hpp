// src/frame_buffer.hpp
// Per-connection outbound frame: item batching and mutex-guarded flushing.

#pragma once

#include "apns/config.hpp"
#include "apns/stream.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace spdlog {
class logger;
}

namespace apns {

// Accumulates encoded items into one outer frame and writes whole frames to
// the stream. Every mutation happens under mutex(); the stream is written
// only from flush_locked(), so frames never interleave on the wire.
class FrameBuffer {
public:
    FrameBuffer(Stream& stream, const ConnectionConfig& config);

    FrameBuffer(const FrameBuffer&) = delete;
    FrameBuffer& operator=(const FrameBuffer&) = delete;

    // Append one encoded item, stamping its local id into byte 0. Flushes the
    // current frame first if the item would push it past max_frame_size.
    // Returns false if that flush failed.
    bool append(const uint8_t* item, size_t len);

    // Lock and flush. A write failure is reported through on_error after the
    // lock is released.
    bool flush();

    // Write the pending frame. Caller must hold mutex(). No-op (returns true)
    // when nothing but a header is buffered. On write failure the stream is
    // closed and false is returned; nothing is retried. Does not call
    // on_error: the caller does, through report_write_failure(), once it has
    // released mutex().
    bool flush_locked();

    // Hand a Network error to on_error. Must not be called with mutex() held.
    void report_write_failure();

    std::mutex& mutex() noexcept { return mutex_; }

    // Bytes currently buffered, header included.
    size_t pending_bytes();

    uint64_t frames_written() const noexcept { return frames_written_.load(); }
    uint64_t bytes_written() const noexcept { return bytes_written_.load(); }

private:
    void start_frame();

    Stream& stream_;
    size_t max_frame_size_;
    ConnectionConfig::ErrorCallback on_error_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex mutex_;
    std::vector<uint8_t> buf_;
    uint8_t local_id_ = 0;

    std::atomic<uint64_t> frames_written_{0};
    std::atomic<uint64_t> bytes_written_{0};
};

} // namespace apns

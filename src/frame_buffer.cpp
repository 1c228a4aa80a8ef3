// src/frame_buffer.cpp
// Frame batching and flushing.

#include "frame_buffer.hpp"
#include "encoding.hpp"

#include <spdlog/spdlog.h>

namespace apns {

FrameBuffer::FrameBuffer(Stream& stream, const ConnectionConfig& config)
    : stream_(stream),
      max_frame_size_(config.max_frame_size()),
      on_error_(config.on_error()),
      logger_(config.logger()) {
    buf_.reserve(max_frame_size_);
}

void FrameBuffer::start_frame() {
    buf_.clear();
    encoding::write_frame_header(buf_);
    local_id_ = 0;
}

bool FrameBuffer::append(const uint8_t* item, size_t len) {
    bool ok = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (buf_.empty()) {
            start_frame();
        } else if (buf_.size() + len > max_frame_size_) {
            ok = flush_locked();
            start_frame();
        } else {
            // Wraps after 255 items; the peer only uses it within one frame.
            local_id_++;
        }

        size_t pos = buf_.size();
        buf_.insert(buf_.end(), item, item + len);
        buf_[pos] = local_id_;
    }
    if (!ok) {
        report_write_failure();
    }
    return ok;
}

bool FrameBuffer::flush() {
    bool ok;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ok = flush_locked();
    }
    if (!ok) {
        report_write_failure();
    }
    return ok;
}

void FrameBuffer::report_write_failure() {
    if (on_error_) {
        on_error_(ApnsError::network("frame write failed"));
    }
}

bool FrameBuffer::flush_locked() {
    if (buf_.size() <= encoding::FRAME_HEADER_LENGTH) {
        return true;
    }

    encoding::patch_frame_length(buf_);
    size_t len = buf_.size();
    bool ok = stream_.write_all(buf_.data(), len);
    buf_.clear();

    if (!ok) {
        logger_->error("frame write of {} bytes failed, closing stream", len);
        stream_.close();
        return false;
    }

    frames_written_.fetch_add(1, std::memory_order_relaxed);
    bytes_written_.fetch_add(len, std::memory_order_relaxed);
    logger_->debug("flushed frame of {} bytes", len);
    return true;
}

size_t FrameBuffer::pending_bytes() {
    std::lock_guard<std::mutex> lock(mutex_);
    return buf_.size();
}

} // namespace apns

// src/connection.cpp
// Connection implementation: wires stream, frame buffer and both threads.

#include "apns/connection.hpp"
#include "error_listener.hpp"
#include "frame_buffer.hpp"
#include "sender.hpp"

#include <spdlog/spdlog.h>

namespace apns {

struct Connection::Inner {
    explicit Inner(ConnectionConfig c) : config(std::move(c)) {}

    ConnectionConfig config;
    std::unique_ptr<Stream> stream;
    std::unique_ptr<FrameBuffer> frames;
    std::unique_ptr<Sender> sender;
    std::unique_ptr<ErrorListener> listener;

    void report_error(const ApnsError& err) const {
        if (config.on_error()) {
            config.on_error()(err);
        }
    }
};

Connection::Connection(std::unique_ptr<Stream> stream, ConnectionConfig config)
    : inner_(std::make_unique<Inner>(std::move(config))) {
    inner_->stream = std::move(stream);
    inner_->frames = std::make_unique<FrameBuffer>(*inner_->stream, inner_->config);
    inner_->sender = std::make_unique<Sender>(*inner_->stream, *inner_->frames, inner_->config);

    Sender* sender = inner_->sender.get();
    inner_->listener = std::make_unique<ErrorListener>(
        *inner_->stream,
        [sender](ErrorEvent event) { sender->post_error(std::move(event)); },
        inner_->config.logger());

    inner_->config.logger()->info("connection active (replay buffer {}, max frame {} bytes)",
        inner_->config.replay_buffer_size(), inner_->config.max_frame_size());
}

Connection::~Connection() {
    if (inner_->sender->state() == ConnectionState::Active) {
        disconnect();
    } else {
        inner_->stream->close();
    }
    inner_->listener->join();
    inner_->sender->join();
}

std::unique_ptr<Connection> Connection::create(std::unique_ptr<Stream> stream, ConnectionConfig config) {
    if (!stream) {
        throw ApnsError::configuration("stream is required");
    }
    return std::unique_ptr<Connection>(new Connection(std::move(stream), std::move(config)));
}

std::unique_ptr<Connection> Connection::create(std::unique_ptr<Stream> stream, size_t replay_buffer_size) {
    return create(std::move(stream),
        ConnectionConfig::builder().replay_buffer_size(replay_buffer_size).build());
}

bool Connection::submit(Payload payload) {
    auto status = inner_->sender->submit(std::move(payload)).get();
    if (status == SubmitStatus::Closed) {
        // Encode failures were already reported by the sender.
        inner_->report_error(ApnsError::closed());
    }
    return status == SubmitStatus::Accepted;
}

std::future<CloseResult> Connection::close_notification() {
    return inner_->sender->close_result();
}

void Connection::disconnect() {
    bool flushed;
    {
        std::lock_guard<std::mutex> lock(inner_->frames->mutex());
        flushed = inner_->frames->flush_locked();
    }
    inner_->stream->close();
    if (!flushed) {
        inner_->frames->report_write_failure();
    }
    inner_->config.logger()->info("disconnected");
}

ConnectionState Connection::state() const noexcept {
    return inner_->sender->state();
}

ConnectionStats Connection::stats() const {
    ConnectionStats s;
    s.submitted = inner_->sender->submitted();
    s.frames_written = inner_->frames->frames_written();
    s.bytes_written = inner_->frames->bytes_written();
    s.evicted = inner_->sender->evicted();
    return s;
}

} // namespace apns

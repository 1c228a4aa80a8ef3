// src/error_listener.cpp
// Error response reader thread.

#include "error_listener.hpp"
#include "apns/error.hpp"
#include "encoding.hpp"

#include <spdlog/spdlog.h>

namespace apns {

ErrorListener::ErrorListener(Stream& stream, Sink sink, std::shared_ptr<spdlog::logger> logger)
    : stream_(stream), sink_(std::move(sink)), logger_(std::move(logger)) {
    thread_ = std::thread(&ErrorListener::run, this);
}

ErrorListener::~ErrorListener() {
    join();
}

void ErrorListener::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ErrorListener::run() {
    uint8_t buf[encoding::ERROR_RESPONSE_LENGTH] = {};
    try {
        stream_.read_exact(buf, sizeof(buf));
    } catch (const ApnsError& e) {
        logger_->info("stream read ended: {}", e.what());
        sink_(ErrorEvent::shutdown(e.message()));
        return;
    } catch (const std::exception& e) {
        logger_->error("stream read failed: {}", e.what());
        sink_(ErrorEvent::shutdown(e.what()));
        return;
    }

    auto reply = encoding::decode_error_response(buf);
    auto event = ErrorEvent::from_response(reply.status, reply.notification_id);
    logger_->warn("peer reported {} (status {}) for notification {}",
                  event.message, reply.status, reply.notification_id);
    sink_(std::move(event));
}

} // namespace apns

// src/config.cpp
// Configuration builder and presets.

#include "apns/config.hpp"
#include "encoding.hpp"

#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>

namespace apns {

// --- ConnectionConfig presets ---

ConnectionConfigBuilder ConnectionConfig::builder() {
    return ConnectionConfigBuilder();
}

ConnectionConfig ConnectionConfig::production() {
    return ConnectionConfig::builder().build();
}

ConnectionConfig ConnectionConfig::development() {
    return ConnectionConfig::builder()
        .replay_buffer_size(1000)
        .flush_interval(std::chrono::milliseconds(1000))
        .build();
}

// --- ConnectionConfigBuilder ---

ConnectionConfigBuilder& ConnectionConfigBuilder::replay_buffer_size(size_t size) {
    config_.replay_buffer_size_ = size;
    return *this;
}

ConnectionConfigBuilder& ConnectionConfigBuilder::max_frame_size(size_t size) {
    config_.max_frame_size_ = size;
    return *this;
}

ConnectionConfigBuilder& ConnectionConfigBuilder::max_payload_size(size_t size) {
    config_.max_payload_size_ = size;
    return *this;
}

ConnectionConfigBuilder& ConnectionConfigBuilder::flush_delay(std::chrono::milliseconds delay) {
    config_.flush_delay_ = delay;
    return *this;
}

ConnectionConfigBuilder& ConnectionConfigBuilder::flush_interval(std::chrono::milliseconds interval) {
    config_.flush_interval_ = interval;
    return *this;
}

ConnectionConfigBuilder& ConnectionConfigBuilder::on_error(ConnectionConfig::ErrorCallback callback) {
    config_.on_error_ = std::move(callback);
    return *this;
}

ConnectionConfigBuilder& ConnectionConfigBuilder::logger(std::shared_ptr<spdlog::logger> logger) {
    config_.logger_ = std::move(logger);
    return *this;
}

ConnectionConfig ConnectionConfigBuilder::build() const {
    ConnectionConfig result = config_;

    if (result.replay_buffer_size_ == 0) {
        throw ApnsError::configuration("replay_buffer_size must be positive");
    }
    if (result.max_payload_size_ == 0) {
        throw ApnsError::configuration("max_payload_size must be positive");
    }
    if (result.max_payload_size_ > UINT16_MAX - encoding::ITEM_FIXED_LENGTH) {
        throw ApnsError::configuration("max_payload_size does not fit the 16-bit item length");
    }
    size_t min_frame = encoding::FRAME_HEADER_LENGTH +
                       encoding::item_size(result.max_payload_size_);
    if (result.max_frame_size_ < min_frame) {
        throw ApnsError::configuration("max_frame_size must be at least " +
            std::to_string(min_frame) + " to hold one maximal item");
    }
    if (result.max_frame_size_ > UINT32_MAX) {
        throw ApnsError::configuration("max_frame_size does not fit the 32-bit frame length");
    }
    if (result.flush_delay_.count() <= 0 || result.flush_interval_.count() <= 0) {
        throw ApnsError::configuration("flush timers must be positive");
    }

    if (!result.logger_) {
        result.logger_ = std::make_shared<spdlog::logger>(
            "apns", std::make_shared<spdlog::sinks::null_sink_mt>());
    }
    return result;
}

} // namespace apns

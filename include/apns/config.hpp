// include/apns/config.hpp
// Flat connection configuration with builder pattern.

#pragma once

#include "error.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace spdlog {
class logger;
}

namespace apns {

class ConnectionConfigBuilder;

// Configuration for one Connection.
class ConnectionConfig {
public:
    using ErrorCallback = std::function<void(const ApnsError&)>;

    static ConnectionConfigBuilder builder();

    static ConnectionConfig production();
    static ConnectionConfig development();

    size_t replay_buffer_size() const noexcept { return replay_buffer_size_; }
    size_t max_frame_size() const noexcept { return max_frame_size_; }
    size_t max_payload_size() const noexcept { return max_payload_size_; }
    std::chrono::milliseconds flush_delay() const noexcept { return flush_delay_; }
    std::chrono::milliseconds flush_interval() const noexcept { return flush_interval_; }
    const ErrorCallback& on_error() const noexcept { return on_error_; }
    const std::shared_ptr<spdlog::logger>& logger() const noexcept { return logger_; }

private:
    friend class ConnectionConfigBuilder;
    ConnectionConfig() = default;

    size_t replay_buffer_size_ = 10000;
    size_t max_frame_size_ = 65535;
    size_t max_payload_size_ = 256;
    std::chrono::milliseconds flush_delay_{10};
    std::chrono::milliseconds flush_interval_{5 * 60 * 1000};
    ErrorCallback on_error_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Fluent builder for ConnectionConfig.
class ConnectionConfigBuilder {
public:
    ConnectionConfigBuilder() = default;

    // Number of submitted payloads retained for post-mortem reconstruction.
    ConnectionConfigBuilder& replay_buffer_size(size_t size);
    // Largest outer frame, header included.
    ConnectionConfigBuilder& max_frame_size(size_t size);
    // Largest marshaled payload body.
    ConnectionConfigBuilder& max_payload_size(size_t size);
    // Short timer re-armed after each submission to coalesce bursts.
    ConnectionConfigBuilder& flush_delay(std::chrono::milliseconds delay);
    // Long timer bounding latency under light traffic.
    ConnectionConfigBuilder& flush_interval(std::chrono::milliseconds interval);
    ConnectionConfigBuilder& on_error(ConnectionConfig::ErrorCallback callback);
    ConnectionConfigBuilder& logger(std::shared_ptr<spdlog::logger> logger);

    // Build the config. Throws ApnsError on invalid values.
    ConnectionConfig build() const;

private:
    ConnectionConfig config_;
};

} // namespace apns

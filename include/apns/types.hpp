// include/apns/types.hpp
// Protocol enums, response table and the terminal error event.

#pragma once

#include <cstdint>
#include <string>

namespace apns {

// Status byte of the peer's 6-byte error response.
enum class ResponseCode : uint8_t {
    NoErrors           = 0,
    ProcessingError    = 1,
    MissingDeviceToken = 2,
    MissingTopic       = 3,
    MissingPayload     = 4,
    InvalidTokenSize   = 5,
    InvalidTopicSize   = 6,
    InvalidPayloadSize = 7,
    InvalidToken       = 8,
    Shutdown           = 10,
    Unknown            = 255,
};

// Delivery priority carried in the last byte of every item.
enum class Priority : uint8_t {
    Conserve  = 5,   // Power-conserving delivery
    Immediate = 10,  // Deliver immediately
};

// Connection lifecycle.
enum class ConnectionState : uint8_t {
    Active  = 0,
    Closing = 1,
    Closed  = 2,
};

// Map a raw status byte onto the known table; anything unlisted is Unknown.
ResponseCode normalize_response_code(uint8_t raw) noexcept;

// Protocol name for a code, e.g. "INVALID_TOKEN".
const char* response_code_name(ResponseCode code) noexcept;

// The single terminal event of a connection: either the peer's error response
// or a synthetic Shutdown produced when the stream failed locally.
struct ErrorEvent {
    ResponseCode code = ResponseCode::Unknown;
    uint8_t raw_code = 0;
    std::string message;
    uint32_t notification_id = 0;  // 0: no specific payload

    bool remote() const noexcept { return !local_; }

    static ErrorEvent from_response(uint8_t status, uint32_t id);
    static ErrorEvent shutdown(std::string reason);

private:
    bool local_ = false;
};

} // namespace apns

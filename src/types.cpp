// src/types.cpp
// Static response-code table.

#include "apns/types.hpp"

#include <utility>

namespace apns {

namespace {

struct ResponseEntry {
    uint8_t code;
    const char* name;
};

constexpr ResponseEntry RESPONSE_TABLE[] = {
    {0,   "NO_ERRORS"},
    {1,   "PROCESSING_ERROR"},
    {2,   "MISSING_DEVICE_TOKEN"},
    {3,   "MISSING_TOPIC"},
    {4,   "MISSING_PAYLOAD"},
    {5,   "INVALID_TOKEN_SIZE"},
    {6,   "INVALID_TOPIC_SIZE"},
    {7,   "INVALID_PAYLOAD_SIZE"},
    {8,   "INVALID_TOKEN"},
    {10,  "SHUTDOWN"},
    {255, "UNKNOWN"},
};

} // namespace

ResponseCode normalize_response_code(uint8_t raw) noexcept {
    for (const auto& entry : RESPONSE_TABLE) {
        if (entry.code == raw) return static_cast<ResponseCode>(raw);
    }
    return ResponseCode::Unknown;
}

const char* response_code_name(ResponseCode code) noexcept {
    auto raw = static_cast<uint8_t>(code);
    for (const auto& entry : RESPONSE_TABLE) {
        if (entry.code == raw) return entry.name;
    }
    return "UNKNOWN";
}

ErrorEvent ErrorEvent::from_response(uint8_t status, uint32_t id) {
    ErrorEvent ev;
    ev.code = normalize_response_code(status);
    ev.raw_code = status;
    ev.message = response_code_name(ev.code);
    ev.notification_id = id;
    return ev;
}

ErrorEvent ErrorEvent::shutdown(std::string reason) {
    ErrorEvent ev;
    ev.code = ResponseCode::Shutdown;
    ev.raw_code = static_cast<uint8_t>(ResponseCode::Shutdown);
    ev.message = std::move(reason);
    ev.notification_id = 0;
    ev.local_ = true;
    return ev;
}

} // namespace apns

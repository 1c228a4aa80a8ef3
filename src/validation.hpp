// src/validation.hpp
// Internal input validation functions.

#pragma once

#include "apns/error.hpp"
#include "apns/types.hpp"
#include <array>
#include <cstdint>
#include <string>

namespace apns {
namespace validation {

static constexpr size_t TOKEN_LENGTH = 32;

// Validate and decode a 64-character hex device token to 32 bytes.
inline std::array<uint8_t, TOKEN_LENGTH> validate_and_decode_token(const std::string& token) {
    if (token.size() != TOKEN_LENGTH * 2) {
        throw ApnsError::invalid_token(
            "must be " + std::to_string(TOKEN_LENGTH * 2) + " hex characters, got " +
            std::to_string(token.size()));
    }

    auto hex_val = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::array<uint8_t, TOKEN_LENGTH> bytes{};
    for (size_t i = 0; i < TOKEN_LENGTH; i++) {
        int hi = hex_val(token[i * 2]);
        int lo = hex_val(token[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            throw ApnsError::invalid_token(
                std::string("contains non-hex character '") + token[hi < 0 ? i*2 : i*2+1] + "'");
        }
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }

    return bytes;
}

// Only 5 and 10 are valid on the wire; everything else becomes 5.
inline uint8_t normalize_priority(uint8_t priority) {
    if (priority == static_cast<uint8_t>(Priority::Immediate)) return priority;
    return static_cast<uint8_t>(Priority::Conserve);
}

} // namespace validation
} // namespace apns

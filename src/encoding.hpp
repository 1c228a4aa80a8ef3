// src/encoding.hpp
// Binary frame encoding for the legacy push protocol (all big-endian).
//
//   frame: type(1)=2 | length(4) | item...
//   item:  localId(1) | itemLength(2) | token(32) | payload | id(4) | expiration(4) | priority(1)
//   reply: command(1) | status(1) | id(4)

#pragma once

#include "apns/types.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace apns {
namespace encoding {

static constexpr uint8_t FRAME_TYPE = 2;
static constexpr size_t FRAME_HEADER_LENGTH = 5;
static constexpr size_t ITEM_HEADER_LENGTH = 3;           // localId + itemLength
static constexpr size_t TOKEN_LENGTH = 32;
static constexpr size_t ITEM_FIXED_LENGTH = TOKEN_LENGTH + 4 + 4 + 1;
static constexpr size_t ERROR_RESPONSE_LENGTH = 6;
static constexpr uint8_t ERROR_RESPONSE_COMMAND = 8;

// Bytes one item occupies in a frame for a given payload length.
constexpr size_t item_size(size_t payload_len) {
    return ITEM_HEADER_LENGTH + ITEM_FIXED_LENGTH + payload_len;
}

// --- Helper functions ---

inline void write_u16_be(std::vector<uint8_t>& buf, uint16_t value) {
    buf.push_back(static_cast<uint8_t>(value >> 8));
    buf.push_back(static_cast<uint8_t>(value));
}

inline void write_u32_be(std::vector<uint8_t>& buf, uint32_t value) {
    buf.push_back(static_cast<uint8_t>(value >> 24));
    buf.push_back(static_cast<uint8_t>(value >> 16));
    buf.push_back(static_cast<uint8_t>(value >> 8));
    buf.push_back(static_cast<uint8_t>(value));
}

inline uint16_t read_u16_be(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

inline uint32_t read_u32_be(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

inline void patch_u32_be(std::vector<uint8_t>& buf, size_t pos, uint32_t value) {
    buf[pos]     = static_cast<uint8_t>(value >> 24);
    buf[pos + 1] = static_cast<uint8_t>(value >> 16);
    buf[pos + 2] = static_cast<uint8_t>(value >> 8);
    buf[pos + 3] = static_cast<uint8_t>(value);
}

// --- Item encoding ---

struct ItemParams {
    uint8_t local_id = 0;
    const uint8_t* token = nullptr;   // TOKEN_LENGTH bytes
    const uint8_t* payload = nullptr;
    size_t payload_len = 0;
    uint32_t notification_id = 0;
    uint32_t expiration = 0;
    uint8_t priority = 5;             // already normalized
};

// Append one item to buf and return its start position. The caller must have
// bounded payload_len so that itemLength fits 16 bits.
inline size_t encode_item_into(std::vector<uint8_t>& buf, const ItemParams& params) {
    size_t start = buf.size();
    buf.reserve(start + item_size(params.payload_len));

    buf.push_back(params.local_id);
    write_u16_be(buf, static_cast<uint16_t>(ITEM_FIXED_LENGTH + params.payload_len));
    buf.insert(buf.end(), params.token, params.token + TOKEN_LENGTH);
    if (params.payload && params.payload_len > 0) {
        buf.insert(buf.end(), params.payload, params.payload + params.payload_len);
    }
    write_u32_be(buf, params.notification_id);
    write_u32_be(buf, params.expiration);
    buf.push_back(params.priority);
    return start;
}

// --- Frame envelope ---

inline void write_frame_header(std::vector<uint8_t>& buf) {
    buf.push_back(FRAME_TYPE);
    write_u32_be(buf, 0);  // patched on flush
}

// Fill in the frame length (total minus header) of a frame starting at 0.
inline void patch_frame_length(std::vector<uint8_t>& buf) {
    patch_u32_be(buf, 1, static_cast<uint32_t>(buf.size() - FRAME_HEADER_LENGTH));
}

// --- Decoding (diagnostics, tests and test peers) ---

struct DecodedItem {
    uint8_t local_id = 0;
    uint16_t item_length = 0;
    std::array<uint8_t, TOKEN_LENGTH> token{};
    std::vector<uint8_t> payload;
    uint32_t notification_id = 0;
    uint32_t expiration = 0;
    uint8_t priority = 0;
};

// Decode one item from data. Returns nullopt if len is too short or the
// item length is smaller than the fixed part.
inline std::optional<DecodedItem> decode_item(const uint8_t* data, size_t len, size_t* consumed = nullptr) {
    if (len < ITEM_HEADER_LENGTH) return std::nullopt;
    uint16_t item_length = read_u16_be(data + 1);
    if (item_length < ITEM_FIXED_LENGTH || len < ITEM_HEADER_LENGTH + item_length) {
        return std::nullopt;
    }

    DecodedItem item;
    item.local_id = data[0];
    item.item_length = item_length;
    const uint8_t* p = data + ITEM_HEADER_LENGTH;
    std::copy(p, p + TOKEN_LENGTH, item.token.begin());
    p += TOKEN_LENGTH;
    size_t payload_len = item_length - ITEM_FIXED_LENGTH;
    item.payload.assign(p, p + payload_len);
    p += payload_len;
    item.notification_id = read_u32_be(p);
    item.expiration = read_u32_be(p + 4);
    item.priority = p[8];

    if (consumed) *consumed = ITEM_HEADER_LENGTH + item_length;
    return item;
}

struct DecodedFrame {
    uint8_t type = 0;
    uint32_t length = 0;
    std::vector<DecodedItem> items;
};

// Decode one complete frame. Returns nullopt on a short buffer or if the
// items do not exactly fill the declared length.
inline std::optional<DecodedFrame> decode_frame(const uint8_t* data, size_t len, size_t* consumed = nullptr) {
    if (len < FRAME_HEADER_LENGTH) return std::nullopt;

    DecodedFrame frame;
    frame.type = data[0];
    frame.length = read_u32_be(data + 1);
    if (len - FRAME_HEADER_LENGTH < frame.length) return std::nullopt;

    size_t pos = FRAME_HEADER_LENGTH;
    size_t end = FRAME_HEADER_LENGTH + frame.length;
    while (pos < end) {
        size_t used = 0;
        auto item = decode_item(data + pos, end - pos, &used);
        if (!item) return std::nullopt;
        frame.items.push_back(std::move(*item));
        pos += used;
    }

    if (consumed) *consumed = end;
    return frame;
}

// --- Error response ---

struct ErrorResponse {
    uint8_t command = 0;
    uint8_t status = 0;
    uint32_t notification_id = 0;
};

inline ErrorResponse decode_error_response(const uint8_t* data) {
    ErrorResponse r;
    r.command = data[0];
    r.status = data[1];
    r.notification_id = read_u32_be(data + 2);
    return r;
}

inline void encode_error_response_into(std::vector<uint8_t>& buf, uint8_t status, uint32_t notification_id) {
    buf.push_back(ERROR_RESPONSE_COMMAND);
    buf.push_back(status);
    write_u32_be(buf, notification_id);
}

} // namespace encoding
} // namespace apns

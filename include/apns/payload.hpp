// include/apns/payload.hpp
// Notification payload. Writes the JSON body directly, no DOM allocation.

#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace apns {

// One push notification addressed to one device.
//
// The body is built as raw JSON bytes: the "aps" dictionary from the typed
// setters, followed by any custom top-level fields. A caller that already
// has a serialized body can hand it over with raw_body().
//
// Example:
//   auto p = Payload("a1b2...").alert("Hello").badge(3).custom("thread", "news");
class Payload {
public:
    Payload() = default;
    explicit Payload(std::string token) : token_(std::move(token)) {}

    Payload& token(std::string hex) { token_ = std::move(hex); return *this; }
    Payload& priority(uint8_t value) { priority_ = value; return *this; }
    Payload& priority(Priority value) { priority_ = static_cast<uint8_t>(value); return *this; }
    Payload& expiration(uint32_t epoch_seconds) { expiration_ = epoch_seconds; return *this; }

    Payload& alert(std::string text) { alert_ = std::move(text); return *this; }
    Payload& badge(int value) { badge_ = value; return *this; }
    Payload& sound(std::string name) { sound_ = std::move(name); return *this; }
    Payload& content_available(bool value) { content_available_ = value; return *this; }

    Payload& custom(const std::string& key, const std::string& value);
    Payload& custom(const std::string& key, const char* value);
    Payload& custom(const std::string& key, int64_t value);
    Payload& custom(const std::string& key, int value);
    Payload& custom(const std::string& key, bool value);

    // Replace the generated body with pre-serialized bytes.
    Payload& raw_body(std::vector<uint8_t> body) { raw_body_ = std::move(body); return *this; }

    const std::string& token() const noexcept { return token_; }
    uint8_t priority() const noexcept { return priority_; }
    uint32_t expiration() const noexcept { return expiration_; }

    // Serialize the body. Throws ApnsError (Serialization) if the result
    // exceeds max_size bytes.
    std::vector<uint8_t> marshal(size_t max_size) const;

private:
    void begin_custom(const std::string& key);

    std::string token_;
    uint8_t priority_ = static_cast<uint8_t>(Priority::Immediate);
    uint32_t expiration_ = 0;

    std::optional<std::string> alert_;
    std::optional<int> badge_;
    std::optional<std::string> sound_;
    bool content_available_ = false;

    std::vector<uint8_t> custom_;  // "key":value,... without braces
    std::optional<std::vector<uint8_t>> raw_body_;
};

} // namespace apns

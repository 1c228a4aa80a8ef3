// src/payload.cpp
// Payload body marshaling.

#include "apns/payload.hpp"
#include "apns/error.hpp"

#include <cstdio>
#include <cstring>

namespace apns {

namespace {

bool needs_escape(char c) {
    return c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20;
}

// Append s as JSON string content; bulk-copies runs of safe characters.
void write_escaped(std::vector<uint8_t>& buf, const char* s, size_t len) {
    size_t i = 0;
    while (i < len) {
        size_t run_start = i;
        while (i < len && !needs_escape(s[i])) ++i;

        if (i > run_start) {
            buf.insert(buf.end(),
                reinterpret_cast<const uint8_t*>(s + run_start),
                reinterpret_cast<const uint8_t*>(s + i));
        }

        if (i < len) {
            char c = s[i];
            switch (c) {
                case '"':  buf.push_back('\\'); buf.push_back('"'); break;
                case '\\': buf.push_back('\\'); buf.push_back('\\'); break;
                case '\b': buf.push_back('\\'); buf.push_back('b'); break;
                case '\f': buf.push_back('\\'); buf.push_back('f'); break;
                case '\n': buf.push_back('\\'); buf.push_back('n'); break;
                case '\r': buf.push_back('\\'); buf.push_back('r'); break;
                case '\t': buf.push_back('\\'); buf.push_back('t'); break;
                default: {
                    char hex[7];
                    std::snprintf(hex, sizeof(hex), "\\u%04x", static_cast<unsigned char>(c));
                    buf.insert(buf.end(), hex, hex + 6);
                    break;
                }
            }
            ++i;
        }
    }
}

void write_quoted(std::vector<uint8_t>& buf, const std::string& s) {
    buf.push_back('"');
    write_escaped(buf, s.data(), s.size());
    buf.push_back('"');
}

void write_lit(std::vector<uint8_t>& buf, const char* s) {
    buf.insert(buf.end(), s, s + std::strlen(s));
}

void write_int(std::vector<uint8_t>& buf, long long value) {
    char tmp[24];
    int n = std::snprintf(tmp, sizeof(tmp), "%lld", value);
    if (n > 0) buf.insert(buf.end(), tmp, tmp + n);
}

} // namespace

void Payload::begin_custom(const std::string& key) {
    if (!custom_.empty()) custom_.push_back(',');
    write_quoted(custom_, key);
    custom_.push_back(':');
}

Payload& Payload::custom(const std::string& key, const std::string& value) {
    begin_custom(key);
    write_quoted(custom_, value);
    return *this;
}

Payload& Payload::custom(const std::string& key, const char* value) {
    return custom(key, std::string(value));
}

Payload& Payload::custom(const std::string& key, int64_t value) {
    begin_custom(key);
    write_int(custom_, static_cast<long long>(value));
    return *this;
}

Payload& Payload::custom(const std::string& key, int value) {
    return custom(key, static_cast<int64_t>(value));
}

Payload& Payload::custom(const std::string& key, bool value) {
    begin_custom(key);
    write_lit(custom_, value ? "true" : "false");
    return *this;
}

std::vector<uint8_t> Payload::marshal(size_t max_size) const {
    if (raw_body_) {
        if (raw_body_->size() > max_size) {
            throw ApnsError::payload_too_large(raw_body_->size(), max_size);
        }
        return *raw_body_;
    }

    std::vector<uint8_t> buf;
    buf.reserve(64 + custom_.size() + (alert_ ? alert_->size() : 0));

    write_lit(buf, "{\"aps\":{");
    bool first = true;
    auto sep = [&]() {
        if (!first) buf.push_back(',');
        first = false;
    };
    if (alert_) {
        sep();
        write_lit(buf, "\"alert\":");
        write_quoted(buf, *alert_);
    }
    if (badge_) {
        sep();
        write_lit(buf, "\"badge\":");
        write_int(buf, *badge_);
    }
    if (sound_) {
        sep();
        write_lit(buf, "\"sound\":");
        write_quoted(buf, *sound_);
    }
    if (content_available_) {
        sep();
        write_lit(buf, "\"content-available\":1");
    }
    buf.push_back('}');

    if (!custom_.empty()) {
        buf.push_back(',');
        buf.insert(buf.end(), custom_.begin(), custom_.end());
    }
    buf.push_back('}');

    if (buf.size() > max_size) {
        throw ApnsError::payload_too_large(buf.size(), max_size);
    }
    return buf;
}

} // namespace apns

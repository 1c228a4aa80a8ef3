// src/replay_buffer.cpp
// Replay history and close-time partitioning.

#include "replay_buffer.hpp"
#include "apns/error.hpp"

#include <algorithm>

namespace apns {

ReplayBuffer::ReplayBuffer(size_t capacity, uint32_t last_id)
    : capacity_(capacity), last_id_(last_id) {
    if (capacity_ == 0) {
        throw ApnsError::configuration("replay buffer capacity must be positive");
    }
}

uint32_t ReplayBuffer::peek_next_id() const noexcept {
    uint32_t id = last_id_ + 1;
    return id == 0 ? 1 : id;
}

uint32_t ReplayBuffer::next_id() noexcept {
    last_id_ = peek_next_id();
    return last_id_;
}

const IdentifiedPayload& ReplayBuffer::push(Payload payload) {
    entries_.push_front(IdentifiedPayload{next_id(), std::move(payload)});
    if (entries_.size() > capacity_) {
        entries_.pop_back();
        evicted_++;
    }
    return entries_.front();
}

CloseResult ReplayBuffer::resolve(const ErrorEvent& event) const {
    CloseResult result;
    result.error = event;

    // Entries newer than the failing id were never attempted: the peer
    // processes items in submission order and stops at the first error.
    for (const auto& entry : entries_) {
        if (event.notification_id != 0 && entry.id == event.notification_id) {
            result.error_payload = entry.payload;
            break;
        }
        result.unsent_payloads.push_back(entry.payload);
    }
    std::reverse(result.unsent_payloads.begin(), result.unsent_payloads.end());

    // Without a match the failure point may lie in evicted history. An id
    // that is simply unknown with nothing evicted keeps the flag clear.
    result.unsent_payload_buffer_overflow = !result.error_payload && evicted_ > 0;
    return result;
}

} // namespace apns

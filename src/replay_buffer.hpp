// src/replay_buffer.hpp
// Notification id assignment and bounded newest-first submission history.

#pragma once

#include "apns/close_result.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>

namespace apns {

// Owned by the sender thread only; not synchronized.
class ReplayBuffer {
public:
    // last_id seeds the counter: the first push gets last_id + 1 (skipping 0).
    explicit ReplayBuffer(size_t capacity, uint32_t last_id = 0);

    // Assign the next id and record the payload as the newest entry. Evicts
    // the oldest entry once the history is over capacity.
    const IdentifiedPayload& push(Payload payload);

    // Id the next push will assign.
    uint32_t peek_next_id() const noexcept;

    // Partition the history around the event's notification id.
    CloseResult resolve(const ErrorEvent& event) const;

    size_t size() const noexcept { return entries_.size(); }
    size_t capacity() const noexcept { return capacity_; }
    uint64_t evicted() const noexcept { return evicted_; }

    // Newest first.
    const std::deque<IdentifiedPayload>& entries() const noexcept { return entries_; }

private:
    uint32_t next_id() noexcept;

    size_t capacity_;
    std::deque<IdentifiedPayload> entries_;
    uint32_t last_id_ = 0;
    uint64_t evicted_ = 0;
};

} // namespace apns

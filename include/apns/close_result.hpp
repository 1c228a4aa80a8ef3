// include/apns/close_result.hpp
// Terminal report delivered once when a connection ends.

#pragma once

#include "payload.hpp"
#include "types.hpp"

#include <optional>
#include <vector>

namespace apns {

// A payload paired with its connection-scoped notification id (never 0).
struct IdentifiedPayload {
    uint32_t id = 0;
    Payload payload;
};

struct CloseResult {
    // The terminal event: the peer's error response, or Shutdown for a local
    // stream failure.
    ErrorEvent error;

    // Payloads that were definitely never processed, oldest first. Safe to
    // resubmit on a new connection.
    std::vector<Payload> unsent_payloads;

    // The payload the peer rejected, if it was still in the replay history.
    std::optional<Payload> error_payload;

    // History was evicted before the failure point could be located; payloads
    // older than the retained window may also have been lost.
    bool unsent_payload_buffer_overflow = false;
};

} // namespace apns

// include/apns/connection.hpp
// Client connection for the legacy binary push protocol.

#pragma once

#include "close_result.hpp"
#include "config.hpp"
#include "error.hpp"
#include "payload.hpp"
#include "stream.hpp"
#include "types.hpp"

#include <cstdint>
#include <future>
#include <memory>

namespace apns {

// Point-in-time counters for diagnostics.
struct ConnectionStats {
    uint64_t submitted = 0;       // payloads recorded in the replay history
    uint64_t frames_written = 0;
    uint64_t bytes_written = 0;
    uint64_t evicted = 0;         // history entries dropped for capacity
};

// One connection to a push gateway over an already-open stream.
//
// Created via Connection::create(stream, config). Two background threads run
// until the connection ends: a sender that batches submitted payloads into
// frames, and a listener waiting for the gateway's error response. The first
// error (or local stream failure) ends the connection and produces exactly one
// CloseResult, listing which payloads are safe to resubmit. Reconnecting and
// resubmitting are up to the caller.
//
// Example:
//   auto conn = Connection::create(SocketStream::connect(host, 5s), ConnectionConfig::production());
//   auto closed = conn->close_notification();
//   conn->submit(Payload(token).alert("Hello"));
//   CloseResult result = closed.get();
class Connection {
public:
    // Takes ownership of the stream and starts both worker threads.
    // Throws ApnsError on a null stream.
    static std::unique_ptr<Connection> create(std::unique_ptr<Stream> stream, ConnectionConfig config);

    // Default configuration with the given replay history capacity.
    static std::unique_ptr<Connection> create(std::unique_ptr<Stream> stream, size_t replay_buffer_size);

    // Disconnects if still active and joins both threads.
    ~Connection();

    // Only ever owned through the unique_ptr that create() returns.
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(Connection&&) = delete;

    // Hand a payload to the sender, blocking until it has been taken. Returns
    // false (and reports ApnsError::closed through on_error) once the
    // connection is going down; such a payload is not part of the close result.
    bool submit(Payload payload);

    // Receive side of the close notification: resolves exactly once with the
    // CloseResult. May be called once; throws ApnsError (Closed) after that.
    std::future<CloseResult> close_notification();

    // Flush whatever is buffered, then close the stream. Does not itself
    // produce a CloseResult; the listener observes the closed stream and the
    // connection ends through the normal path with a Shutdown event.
    void disconnect();

    ConnectionState state() const noexcept;
    ConnectionStats stats() const;

private:
    Connection(std::unique_ptr<Stream> stream, ConnectionConfig config);
    struct Inner;
    std::unique_ptr<Inner> inner_;
};

} // namespace apns

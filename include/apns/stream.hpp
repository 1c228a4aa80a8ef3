// include/apns/stream.hpp
// Duplex byte stream consumed by a Connection.

#pragma once

#include <cstddef>
#include <cstdint>

namespace apns {

// An already-connected (and, where required, already-secured) byte stream.
//
// A Connection writes from its flush path and reads from its error listener
// concurrently, so implementations must allow one writer and one reader at
// the same time, and close() from any thread.
class Stream {
public:
    virtual ~Stream() = default;

    // Write every byte. Returns false on failure; the caller closes the stream.
    virtual bool write_all(const uint8_t* data, size_t len) = 0;

    // Block until exactly len bytes are read. Throws ApnsError: Closed on EOF
    // or after close(), Io on any other failure.
    virtual void read_exact(uint8_t* data, size_t len) = 0;

    // Idempotent. Must wake a reader blocked in read_exact().
    virtual void close() noexcept = 0;
};

} // namespace apns

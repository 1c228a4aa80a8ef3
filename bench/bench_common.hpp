// bench/bench_common.hpp
// Shared benchmark scenarios and helpers.

#pragma once

#include "apns/error.hpp"
#include "apns/payload.hpp"
#include "apns/stream.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace apns_bench {

struct BenchScenario {
    const char* name;
    size_t notifications_per_burst;
    size_t alert_size;

    size_t total_bytes() const { return notifications_per_burst * alert_size; }
};

constexpr BenchScenario SCENARIOS[] = {
    {"single", 1, 40},
    {"typical", 100, 120},
    {"broadcast", 1000, 120},
    {"max_body", 100, 200},
};

constexpr size_t SCENARIO_COUNT = sizeof(SCENARIOS) / sizeof(SCENARIOS[0]);

inline const std::string& bench_token() {
    static const std::string token =
        "feed1e11feed1e11feed1e11feed1e11a1b2c3d4e5f60718293a4b5c6d7e8f90";
    return token;
}

inline apns::Payload make_payload(size_t alert_size) {
    return apns::Payload(bench_token())
        .alert(std::string(alert_size, 'x'))
        .badge(1)
        .sound("default");
}

// Swallows writes; reads block until close(), like a gateway that never errors.
class DiscardStream : public apns::Stream {
public:
    bool write_all(const uint8_t*, size_t) override { return !closed(); }

    void read_exact(uint8_t*, size_t) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_; });
        throw apns::ApnsError::closed("discard stream closed");
    }

    void close() noexcept override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    bool closed() {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace apns_bench

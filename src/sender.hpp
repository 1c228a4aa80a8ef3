// src/sender.hpp
// Sender thread: a mailbox of submissions and the terminal error event.

#pragma once

#include "apns/close_result.hpp"
#include "apns/config.hpp"
#include "apns/payload.hpp"
#include "apns/stream.hpp"
#include "apns/types.hpp"
#include "frame_buffer.hpp"
#include "replay_buffer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <variant>
#include <vector>

namespace spdlog {
class logger;
}

namespace apns {

enum class SubmitStatus : uint8_t {
    Accepted,      // Recorded in the replay history and buffered
    Closed,        // Connection going down; never recorded
    EncodeFailed,  // Bad token or oversized body; connection torn down
};

// A payload handed over by submit(); completion reports what became of it.
struct Submission {
    Payload payload;
    std::shared_ptr<std::promise<SubmitStatus>> accepted;
};

// Sender message: exactly one variant active at a time.
using SenderMessage = std::variant<Submission, ErrorEvent>;

// Drives one connection: ACTIVE until the first ErrorEvent, then CLOSING
// (partition the replay history), then CLOSED (close result delivered).
class Sender {
public:
    Sender(Stream& stream, FrameBuffer& frames, const ConnectionConfig& config);
    ~Sender();

    Sender(const Sender&) = delete;
    Sender& operator=(const Sender&) = delete;

    // Queue a payload. The future resolves once the sender has taken it.
    std::future<SubmitStatus> submit(Payload payload);

    // Deliver the terminal event. Only the first call has any effect; later
    // calls return without blocking.
    void post_error(ErrorEvent event);

    // The close notification. Can be taken once; throws ApnsError after.
    std::future<CloseResult> close_result();

    ConnectionState state() const noexcept { return state_.load(); }
    uint64_t submitted() const noexcept { return submitted_.load(); }
    uint64_t evicted() const noexcept { return evicted_.load(); }

    void join();

private:
    void run();
    void handle_submission(Submission& submission);
    void force_disconnect();
    void stop_accepting();
    void finish(const ErrorEvent& event);

    void enqueue(SenderMessage msg);

    Stream& stream_;
    FrameBuffer& frames_;
    std::chrono::milliseconds flush_delay_;
    std::chrono::milliseconds flush_interval_;
    size_t max_payload_size_;
    ConnectionConfig::ErrorCallback on_error_;
    std::shared_ptr<spdlog::logger> logger_;

    ReplayBuffer replay_;
    std::vector<uint8_t> item_buf_;

    // Channel
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<SenderMessage> queue_;
    bool accepting_ = true;
    bool error_posted_ = false;

    std::promise<CloseResult> close_promise_;
    std::atomic<bool> close_taken_{false};

    std::atomic<ConnectionState> state_{ConnectionState::Active};
    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> evicted_{0};

    std::thread thread_;
};

} // namespace apns

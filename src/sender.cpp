// src/sender.cpp
// Connection orchestrator thread implementation.

#include "sender.hpp"
#include "apns/error.hpp"
#include "encoding.hpp"
#include "validation.hpp"

#include <spdlog/spdlog.h>

namespace apns {

Sender::Sender(Stream& stream, FrameBuffer& frames, const ConnectionConfig& config)
    : stream_(stream),
      frames_(frames),
      flush_delay_(config.flush_delay()),
      flush_interval_(config.flush_interval()),
      max_payload_size_(config.max_payload_size()),
      on_error_(config.on_error()),
      logger_(config.logger()),
      replay_(config.replay_buffer_size()) {
    item_buf_.reserve(encoding::item_size(max_payload_size_));

    thread_ = std::thread(&Sender::run, this);
}

Sender::~Sender() {
    join();
}

void Sender::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void Sender::enqueue(SenderMessage msg) {
    bool was_empty;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_empty = queue_.empty();
        queue_.push(std::move(msg));
    }
    // Only wake the sender if it's likely sleeping (queue was empty)
    if (was_empty) {
        cv_.notify_one();
    }
}

std::future<SubmitStatus> Sender::submit(Payload payload) {
    auto p = std::make_shared<std::promise<SubmitStatus>>();
    auto f = p->get_future();

    // Checked and queued under one lock: once the sender stops accepting it
    // drains the queue, so nothing can be left behind unanswered.
    bool was_empty;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            p->set_value(SubmitStatus::Closed);
            return f;
        }
        was_empty = queue_.empty();
        queue_.push(Submission{std::move(payload), std::move(p)});
    }
    if (was_empty) {
        cv_.notify_one();
    }
    return f;
}

void Sender::post_error(ErrorEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (error_posted_) {
            return;
        }
        error_posted_ = true;
    }
    enqueue(std::move(event));
}

std::future<CloseResult> Sender::close_result() {
    if (close_taken_.exchange(true)) {
        throw ApnsError::closed("close notification already taken");
    }
    return close_promise_.get_future();
}

void Sender::run() {
    auto deadline = std::chrono::steady_clock::now() + flush_interval_;

    while (true) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, deadline, [this] { return !queue_.empty(); });

        // Drain all pending messages
        std::queue<SenderMessage> local_queue;
        std::swap(local_queue, queue_);
        lock.unlock();

        bool submitted_any = false;
        while (!local_queue.empty()) {
            auto& msg = local_queue.front();
            if (auto* ev = std::get_if<ErrorEvent>(&msg)) {
                ErrorEvent event = std::move(*ev);
                local_queue.pop();
                // Anything handed over behind the error is never recorded.
                while (!local_queue.empty()) {
                    if (auto* s = std::get_if<Submission>(&local_queue.front())) {
                        s->accepted->set_value(SubmitStatus::Closed);
                    }
                    local_queue.pop();
                }
                finish(event);
                return;
            }
            if (auto* s = std::get_if<Submission>(&msg)) {
                if (accepting_) {
                    handle_submission(*s);
                    submitted_any = true;
                } else {
                    s->accepted->set_value(SubmitStatus::Closed);
                }
            }
            local_queue.pop();
        }

        // Exactly one timer is armed per iteration.
        auto now = std::chrono::steady_clock::now();
        if (submitted_any) {
            deadline = now + flush_delay_;
        } else if (now >= deadline) {
            frames_.flush();
            deadline = now + flush_interval_;
        }
    }
}

void Sender::handle_submission(Submission& submission) {
    const Payload& payload = submission.payload;
    uint32_t id = replay_.peek_next_id();

    // Encode before recording: a rejected payload must not evict history.
    try {
        auto token = validation::validate_and_decode_token(payload.token());
        auto body = payload.marshal(max_payload_size_);

        encoding::ItemParams params;
        params.token = token.data();
        params.payload = body.data();
        params.payload_len = body.size();
        params.notification_id = id;
        params.expiration = payload.expiration();
        params.priority = validation::normalize_priority(payload.priority());

        item_buf_.clear();
        encoding::encode_item_into(item_buf_, params);
    } catch (const ApnsError& e) {
        logger_->error("notification {} could not be encoded: {}", id, e.what());
        submission.accepted->set_value(SubmitStatus::EncodeFailed);
        if (on_error_) {
            on_error_(e);
        }
        force_disconnect();
        return;
    }

    replay_.push(std::move(submission.payload));
    submitted_.fetch_add(1, std::memory_order_relaxed);
    evicted_.store(replay_.evicted(), std::memory_order_relaxed);

    // A failed write has already closed the stream; the listener turns that
    // into the terminal event.
    frames_.append(item_buf_.data(), item_buf_.size());
    submission.accepted->set_value(SubmitStatus::Accepted);
}

void Sender::force_disconnect() {
    stop_accepting();
    frames_.flush();
    stream_.close();
}

void Sender::stop_accepting() {
    std::lock_guard<std::mutex> lock(mutex_);
    accepting_ = false;
    state_.store(ConnectionState::Closing);
}

void Sender::finish(const ErrorEvent& event) {
    stop_accepting();
    logger_->info("connection closing: {} (code {}, notification {})",
                  event.message, static_cast<int>(event.raw_code), event.notification_id);

    std::queue<SenderMessage> leftover;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(leftover, queue_);
    }
    while (!leftover.empty()) {
        if (auto* s = std::get_if<Submission>(&leftover.front())) {
            s->accepted->set_value(SubmitStatus::Closed);
        }
        leftover.pop();
    }

    CloseResult result = replay_.resolve(event);
    if (result.unsent_payload_buffer_overflow) {
        logger_->warn("failure point not in replay history; {} entries were evicted",
                      replay_.evicted());
    }

    close_promise_.set_value(std::move(result));
    state_.store(ConnectionState::Closed);
}

} // namespace apns

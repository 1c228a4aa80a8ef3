// tests/connection_test.cpp
// Connection lifecycle, close reporting, timers and concurrency.

#include "apns/connection.hpp"
#include "encoding.hpp"
#include "memory_stream.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace apns {
namespace {

using testing::MemoryPeer;
using testing::make_memory_stream;

constexpr auto kWait = std::chrono::seconds(5);

// 64 hex chars, distinct per n.
std::string token_for(int n) {
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08x", n);
    return std::string(56, 'a') + buf;
}

Payload payload_for(int n) {
    return Payload(token_for(n)).alert("message " + std::to_string(n));
}

std::vector<std::string> tokens(const std::vector<Payload>& payloads) {
    std::vector<std::string> out;
    for (const auto& p : payloads) out.push_back(p.token());
    return out;
}

// Short flush delay, no long-interval noise, errors collected.
struct Harness {
    std::shared_ptr<MemoryPeer> peer;
    std::mutex errors_mutex;
    std::vector<ErrorKind> errors;
    std::unique_ptr<Connection> conn;

    explicit Harness(size_t replay = 100,
                     std::chrono::milliseconds flush_delay = std::chrono::milliseconds(5)) {
        auto config = ConnectionConfig::builder()
            .replay_buffer_size(replay)
            .flush_delay(flush_delay)
            .flush_interval(std::chrono::hours(1))
            .on_error([this](const ApnsError& e) {
                std::lock_guard<std::mutex> lock(errors_mutex);
                errors.push_back(e.kind());
            })
            .build();
        conn = Connection::create(make_memory_stream(peer), std::move(config));
    }

    std::vector<ErrorKind> error_kinds() {
        std::lock_guard<std::mutex> lock(errors_mutex);
        return errors;
    }
};

CloseResult wait_result(std::future<CloseResult>& f) {
    EXPECT_EQ(f.wait_for(kWait), std::future_status::ready);
    return f.get();
}

std::vector<encoding::DecodedItem> written_items(MemoryPeer& peer) {
    auto bytes = peer.snapshot();
    std::vector<encoding::DecodedItem> items;
    size_t pos = 0;
    while (pos < bytes.size()) {
        size_t used = 0;
        auto frame = encoding::decode_frame(bytes.data() + pos, bytes.size() - pos, &used);
        if (!frame) break;
        for (auto& item : frame->items) items.push_back(std::move(item));
        pos += used;
    }
    return items;
}

// ==================== Lifecycle ====================

TEST(ConnectionTest, CreateAndDestroy) {
    Harness h;
    EXPECT_EQ(h.conn->state(), ConnectionState::Active);
    // Destructor disconnects and joins without hanging.
}

TEST(ConnectionTest, NullStreamRejected) {
    EXPECT_THROW(Connection::create(nullptr, ConnectionConfig::production()), ApnsError);
}

TEST(ConnectionTest, CapacityOverload) {
    std::shared_ptr<MemoryPeer> peer;
    auto conn = Connection::create(make_memory_stream(peer), 3);
    auto closed = conn->close_notification();
    for (int i = 1; i <= 5; i++) ASSERT_TRUE(conn->submit(payload_for(i)));
    peer->hang_up();

    auto result = wait_result(closed);
    EXPECT_EQ(result.unsent_payloads.size(), 3u);
    EXPECT_TRUE(result.unsent_payload_buffer_overflow);
}

TEST(ConnectionTest, CloseNotificationTakenOnce) {
    Harness h;
    auto closed = h.conn->close_notification();
    EXPECT_THROW(h.conn->close_notification(), ApnsError);
}

// ==================== Close reporting ====================

TEST(ConnectionTest, PeerErrorInMiddle) {
    Harness h;
    auto closed = h.conn->close_notification();

    ASSERT_TRUE(h.conn->submit(payload_for(1)));
    ASSERT_TRUE(h.conn->submit(payload_for(2)));
    ASSERT_TRUE(h.conn->submit(payload_for(3)));
    h.peer->reply(8, 2);

    auto result = wait_result(closed);
    EXPECT_EQ(result.error.code, ResponseCode::InvalidToken);
    EXPECT_EQ(result.error.message, "INVALID_TOKEN");
    EXPECT_EQ(result.error.notification_id, 2u);
    ASSERT_TRUE(result.error_payload.has_value());
    EXPECT_EQ(result.error_payload->token(), token_for(2));
    EXPECT_EQ(tokens(result.unsent_payloads), (std::vector<std::string>{token_for(3)}));
    EXPECT_FALSE(result.unsent_payload_buffer_overflow);
    EXPECT_EQ(h.conn->state(), ConnectionState::Closed);
}

TEST(ConnectionTest, ReadFailureBeforeReply) {
    Harness h;
    auto closed = h.conn->close_notification();

    for (int i = 1; i <= 4; i++) ASSERT_TRUE(h.conn->submit(payload_for(i)));
    h.peer->hang_up();

    auto result = wait_result(closed);
    EXPECT_EQ(result.error.code, ResponseCode::Shutdown);
    EXPECT_EQ(result.error.notification_id, 0u);
    EXPECT_FALSE(result.error_payload.has_value());
    EXPECT_EQ(tokens(result.unsent_payloads),
              (std::vector<std::string>{token_for(1), token_for(2), token_for(3), token_for(4)}));
    EXPECT_FALSE(result.unsent_payload_buffer_overflow);
}

TEST(ConnectionTest, UnsentAreEverythingAfterErrorId) {
    Harness h;
    auto closed = h.conn->close_notification();

    for (int i = 1; i <= 10; i++) ASSERT_TRUE(h.conn->submit(payload_for(i)));
    h.peer->reply(7, 4);

    auto result = wait_result(closed);
    ASSERT_TRUE(result.error_payload.has_value());
    EXPECT_EQ(result.error_payload->token(), token_for(4));
    std::vector<std::string> expected;
    for (int i = 5; i <= 10; i++) expected.push_back(token_for(i));
    EXPECT_EQ(tokens(result.unsent_payloads), expected);
}

TEST(ConnectionTest, EvictedErrorIdReportsOverflow) {
    Harness h(3);
    auto closed = h.conn->close_notification();

    for (int i = 1; i <= 6; i++) ASSERT_TRUE(h.conn->submit(payload_for(i)));
    h.peer->reply(8, 1);

    auto result = wait_result(closed);
    EXPECT_FALSE(result.error_payload.has_value());
    EXPECT_TRUE(result.unsent_payload_buffer_overflow);
    EXPECT_EQ(tokens(result.unsent_payloads),
              (std::vector<std::string>{token_for(4), token_for(5), token_for(6)}));
}

TEST(ConnectionTest, UnknownIdWithoutEviction) {
    Harness h;
    auto closed = h.conn->close_notification();

    ASSERT_TRUE(h.conn->submit(payload_for(1)));
    ASSERT_TRUE(h.conn->submit(payload_for(2)));
    h.peer->reply(1, 12345);

    auto result = wait_result(closed);
    EXPECT_EQ(result.error.code, ResponseCode::ProcessingError);
    EXPECT_FALSE(result.error_payload.has_value());
    EXPECT_EQ(result.unsent_payloads.size(), 2u);
    EXPECT_FALSE(result.unsent_payload_buffer_overflow);
}

TEST(ConnectionTest, UnlistedStatusIsUnknown) {
    Harness h;
    auto closed = h.conn->close_notification();
    ASSERT_TRUE(h.conn->submit(payload_for(1)));
    h.peer->reply(42, 1);

    auto result = wait_result(closed);
    EXPECT_EQ(result.error.code, ResponseCode::Unknown);
    EXPECT_EQ(result.error.raw_code, 42);
    ASSERT_TRUE(result.error_payload.has_value());
}

TEST(ConnectionTest, SubmitAfterCloseRejected) {
    Harness h;
    auto closed = h.conn->close_notification();
    ASSERT_TRUE(h.conn->submit(payload_for(1)));
    h.peer->reply(8, 1);
    wait_result(closed);

    EXPECT_FALSE(h.conn->submit(payload_for(2)));
    auto kinds = h.error_kinds();
    ASSERT_FALSE(kinds.empty());
    EXPECT_EQ(kinds.back(), ErrorKind::Closed);
}

// ==================== Encoding failures ====================

TEST(ConnectionTest, BadTokenTearsDown) {
    Harness h;
    auto closed = h.conn->close_notification();

    ASSERT_TRUE(h.conn->submit(payload_for(1)));
    EXPECT_FALSE(h.conn->submit(Payload("not-hex").alert("x")));

    auto result = wait_result(closed);
    EXPECT_EQ(result.error.code, ResponseCode::Shutdown);
    // The rejected payload is not part of the history.
    EXPECT_EQ(tokens(result.unsent_payloads), (std::vector<std::string>{token_for(1)}));
    EXPECT_TRUE(h.peer->is_closed());

    auto kinds = h.error_kinds();
    ASSERT_FALSE(kinds.empty());
    EXPECT_EQ(kinds.front(), ErrorKind::Validation);
}

TEST(ConnectionTest, BadTokenAtCapacityKeepsHistory) {
    Harness h(2, std::chrono::hours(1));
    auto closed = h.conn->close_notification();

    ASSERT_TRUE(h.conn->submit(payload_for(1)));
    ASSERT_TRUE(h.conn->submit(payload_for(2)));
    EXPECT_FALSE(h.conn->submit(Payload("zz").alert("x")));

    auto result = wait_result(closed);
    EXPECT_EQ(result.error.code, ResponseCode::Shutdown);
    EXPECT_EQ(tokens(result.unsent_payloads),
              (std::vector<std::string>{token_for(1), token_for(2)}));
    EXPECT_FALSE(result.unsent_payload_buffer_overflow);

    auto s = h.conn->stats();
    EXPECT_EQ(s.submitted, 2u);
    EXPECT_EQ(s.evicted, 0u);
}

TEST(ConnectionTest, BadTokenDoesNotConsumeId) {
    Harness h(100, std::chrono::hours(1));
    auto closed = h.conn->close_notification();
    ASSERT_TRUE(h.conn->submit(payload_for(1)));
    EXPECT_FALSE(h.conn->submit(Payload("zz")));
    wait_result(closed);

    // Teardown flushed the good item with the first id.
    auto items = written_items(*h.peer);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].notification_id, 1u);
}

TEST(ConnectionTest, OversizedPayloadTearsDown) {
    Harness h;
    auto closed = h.conn->close_notification();

    EXPECT_FALSE(h.conn->submit(Payload(token_for(1)).alert(std::string(400, 'x'))));
    auto result = wait_result(closed);
    EXPECT_EQ(result.error.code, ResponseCode::Shutdown);
    EXPECT_TRUE(result.unsent_payloads.empty());

    auto kinds = h.error_kinds();
    ASSERT_FALSE(kinds.empty());
    EXPECT_EQ(kinds.front(), ErrorKind::Serialization);
}

// ==================== Wire output ====================

TEST(ConnectionTest, ShortTimerFlushesBurst) {
    Harness h;
    for (int i = 1; i <= 5; i++) ASSERT_TRUE(h.conn->submit(payload_for(i)));

    auto body_len = payload_for(1).marshal(256).size();
    size_t expected = encoding::FRAME_HEADER_LENGTH + 5 * encoding::item_size(body_len);
    ASSERT_TRUE(h.peer->wait_for_bytes(expected, kWait));

    auto items = written_items(*h.peer);
    ASSERT_EQ(items.size(), 5u);
    for (size_t i = 0; i < items.size(); i++) {
        EXPECT_EQ(items[i].notification_id, i + 1);
        EXPECT_EQ(items[i].item_length, 32 + items[i].payload.size() + 4 + 4 + 1);
    }
}

TEST(ConnectionTest, PriorityNormalizedOnWire) {
    Harness h;
    ASSERT_TRUE(h.conn->submit(payload_for(1).priority(uint8_t(7)).expiration(1700000000)));
    ASSERT_TRUE(h.conn->submit(payload_for(2).priority(Priority::Immediate)));
    h.conn->disconnect();

    auto items = written_items(*h.peer);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].priority, 5);
    EXPECT_EQ(items[0].expiration, 1700000000u);
    EXPECT_EQ(items[1].priority, 10);
}

TEST(ConnectionTest, DisconnectFlushesPending) {
    // Flush delay long enough that only disconnect can write.
    Harness h(100, std::chrono::hours(1));
    auto closed = h.conn->close_notification();
    ASSERT_TRUE(h.conn->submit(payload_for(1)));
    ASSERT_TRUE(h.conn->submit(payload_for(2)));
    EXPECT_EQ(h.peer->write_count(), 0u);

    h.conn->disconnect();
    EXPECT_EQ(h.peer->write_count(), 1u);
    EXPECT_EQ(written_items(*h.peer).size(), 2u);
    EXPECT_TRUE(h.peer->is_closed());

    // The closed stream ends the connection through the listener.
    auto result = wait_result(closed);
    EXPECT_EQ(result.error.code, ResponseCode::Shutdown);
    EXPECT_EQ(result.unsent_payloads.size(), 2u);
}

TEST(ConnectionTest, DisconnectTwice) {
    Harness h;
    h.conn->disconnect();
    h.conn->disconnect();
}

TEST(ConnectionTest, WriteFailureEndsConnection) {
    Harness h;
    auto closed = h.conn->close_notification();
    {
        std::lock_guard<std::mutex> lock(h.peer->mutex);
        h.peer->fail_writes = true;
    }
    ASSERT_TRUE(h.conn->submit(payload_for(1)));

    auto result = wait_result(closed);
    EXPECT_EQ(result.error.code, ResponseCode::Shutdown);
    EXPECT_EQ(tokens(result.unsent_payloads), (std::vector<std::string>{token_for(1)}));

    auto kinds = h.error_kinds();
    ASSERT_FALSE(kinds.empty());
    EXPECT_EQ(kinds.front(), ErrorKind::Network);
}

// Network errors reach on_error with the frame lock released, so the callback
// may disconnect.
struct DisconnectOnNetworkError {
    std::shared_ptr<MemoryPeer> peer;
    std::atomic<Connection*> raw{nullptr};
    std::atomic<int> network_errors{0};
    std::unique_ptr<Connection> conn;

    explicit DisconnectOnNetworkError(std::chrono::milliseconds flush_delay) {
        auto config = ConnectionConfig::builder()
            .flush_delay(flush_delay)
            .flush_interval(std::chrono::hours(1))
            .on_error([this](const ApnsError& e) {
                if (e.kind() != ErrorKind::Network) return;
                network_errors++;
                if (auto* c = raw.load()) c->disconnect();
            })
            .build();
        conn = Connection::create(make_memory_stream(peer), std::move(config));
        raw.store(conn.get());
    }

    void fail_writes() {
        std::lock_guard<std::mutex> lock(peer->mutex);
        peer->fail_writes = true;
    }
};

TEST(ConnectionTest, OnErrorMayDisconnectFromTimerFlush) {
    DisconnectOnNetworkError h(std::chrono::milliseconds(5));
    auto closed = h.conn->close_notification();
    h.fail_writes();
    ASSERT_TRUE(h.conn->submit(payload_for(1)));

    auto result = wait_result(closed);
    EXPECT_EQ(result.error.code, ResponseCode::Shutdown);
    EXPECT_EQ(tokens(result.unsent_payloads), (std::vector<std::string>{token_for(1)}));
    EXPECT_EQ(h.network_errors.load(), 1);
}

TEST(ConnectionTest, OnErrorMayDisconnectFromDisconnect) {
    DisconnectOnNetworkError h(std::chrono::hours(1));
    auto closed = h.conn->close_notification();
    ASSERT_TRUE(h.conn->submit(payload_for(1)));
    h.fail_writes();

    h.conn->disconnect();
    auto result = wait_result(closed);
    EXPECT_EQ(result.error.code, ResponseCode::Shutdown);
    EXPECT_EQ(result.unsent_payloads.size(), 1u);
    EXPECT_EQ(h.network_errors.load(), 1);
}

// ==================== Stats ====================

TEST(ConnectionTest, Stats) {
    Harness h(2, std::chrono::hours(1));
    for (int i = 1; i <= 3; i++) ASSERT_TRUE(h.conn->submit(payload_for(i)));
    h.conn->disconnect();

    auto s = h.conn->stats();
    EXPECT_EQ(s.submitted, 3u);
    EXPECT_EQ(s.evicted, 1u);
    EXPECT_EQ(s.frames_written, 1u);
    EXPECT_EQ(s.bytes_written, h.peer->snapshot().size());
}

// ==================== Concurrency ====================

TEST(ConnectionTest, ConcurrentSubmit) {
    Harness h(10000);
    auto closed = h.conn->close_notification();
    constexpr int kThreads = 4;
    constexpr int kPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; t++) {
        threads.emplace_back([&h, t]() {
            for (int i = 0; i < kPerThread; i++) {
                EXPECT_TRUE(h.conn->submit(payload_for(t * 1000 + i)));
            }
        });
    }
    for (auto& t : threads) t.join();

    h.conn->disconnect();
    auto result = wait_result(closed);
    EXPECT_EQ(result.unsent_payloads.size(), static_cast<size_t>(kThreads * kPerThread));

    auto items = written_items(*h.peer);
    ASSERT_EQ(items.size(), static_cast<size_t>(kThreads * kPerThread));
    for (size_t i = 0; i < items.size(); i++) {
        EXPECT_EQ(items[i].notification_id, i + 1);
    }
}

TEST(ConnectionTest, SubmittersReleasedOnClose) {
    Harness h;
    auto closed = h.conn->close_notification();
    std::atomic<int> rejected{0};

    std::thread submitter([&]() {
        int i = 0;
        while (true) {
            if (!h.conn->submit(payload_for(i++))) {
                rejected++;
                break;
            }
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    h.peer->reply(10, 0);
    wait_result(closed);
    submitter.join();

    EXPECT_EQ(rejected.load(), 1);
    EXPECT_EQ(h.conn->state(), ConnectionState::Closed);
}

} // namespace
} // namespace apns

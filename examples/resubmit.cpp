// examples/resubmit.cpp
// Reconnect loop: resend what each closed connection reports as unsent.
//
//   cmake -B build -DAPNS_BUILD_EXAMPLES=ON && cmake --build build
//   APNS_ENDPOINT=localhost:2195 ./build/apns_resubmit tokens.txt
//
// tokens.txt holds one device token per line. A token the gateway rejects is
// dropped; everything after it goes out again on a fresh connection.

#include "apns/apns.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <chrono>
#include <cstdlib>
#include <deque>
#include <fstream>
#include <future>
#include <iostream>
#include <string>
#include <thread>

static constexpr int MAX_CONNECTIONS = 5;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <token-file>" << std::endl;
        return 2;
    }

    std::string endpoint = "localhost:2195";
    if (const char* env = std::getenv("APNS_ENDPOINT")) {
        endpoint = env;
    }

    std::deque<apns::Payload> pending;
    {
        std::ifstream in(argv[1]);
        std::string line;
        while (std::getline(in, line)) {
            if (line.empty()) continue;
            pending.push_back(apns::Payload(line).alert("Scheduled maintenance tonight"));
        }
    }

    auto logger = spdlog::stdout_color_mt("apns");
    auto config = apns::ConnectionConfig::builder().logger(logger).build();

    for (int attempt = 1; attempt <= MAX_CONNECTIONS && !pending.empty(); ++attempt) {
        logger->info("connection {}: {} payloads to send", attempt, pending.size());

        std::unique_ptr<apns::Connection> conn;
        try {
            conn = apns::Connection::create(
                apns::SocketStream::connect(endpoint, std::chrono::seconds(5)), config);
        } catch (const apns::ApnsError& e) {
            logger->error("connect failed: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(attempt));
            continue;
        }
        auto closed = conn->close_notification();

        while (!pending.empty()) {
            if (!conn->submit(pending.front())) break;
            pending.pop_front();
        }

        // Silence means nothing failed. Our own hang-up then reports the whole
        // history as unsent, which is already delivered.
        bool hung_up = false;
        if (closed.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
            conn->disconnect();
            hung_up = true;
        }
        auto result = closed.get();

        if (hung_up && result.error.code == apns::ResponseCode::Shutdown) {
            logger->info("gateway stayed silent; connection {} done", attempt);
            continue;
        }
        if (result.error_payload) {
            logger->warn("dropping {}: {}", result.error_payload->token(), result.error.message);
        }
        if (result.unsent_payload_buffer_overflow) {
            logger->warn("failure point was evicted; some notifications may be lost");
        }

        // Unsent go back in front of whatever was never handed over.
        for (auto it = result.unsent_payloads.rbegin(); it != result.unsent_payloads.rend(); ++it) {
            pending.push_front(std::move(*it));
        }
    }

    if (!pending.empty()) {
        logger->error("{} payloads left after {} connections", pending.size(), MAX_CONNECTIONS);
        return 1;
    }
    return 0;
}

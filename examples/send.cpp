// examples/send.cpp
// Send a few notifications over one connection and print the close report.
//
//   cmake -B build -DAPNS_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/apns_send <device-token-hex> [message]
//
// Connects with plain TCP. Point APNS_ENDPOINT at a TLS-terminating proxy
// (for example stunnel in front of gateway.push.apple.com:2195):
//
//   APNS_ENDPOINT=localhost:2195 ./build/apns_send a1b2...

#include "apns/apns.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <future>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <device-token-hex> [message]" << std::endl;
        return 2;
    }
    std::string token = argv[1];
    std::string message = argc > 2 ? argv[2] : "Hello from apns-cpp";

    std::string endpoint = "localhost:2195";
    if (const char* env = std::getenv("APNS_ENDPOINT")) {
        endpoint = env;
    }

    auto logger = spdlog::stdout_color_mt("apns");
    logger->set_level(spdlog::level::debug);

    try {
        auto stream = apns::SocketStream::connect(endpoint, std::chrono::seconds(5));
        auto conn = apns::Connection::create(std::move(stream),
            apns::ConnectionConfig::builder()
                .logger(logger)
                .on_error([](const apns::ApnsError& err) {
                    std::cerr << "  !! " << err.what() << std::endl;
                })
                .build());
        auto closed = conn->close_notification();

        conn->submit(apns::Payload(token).alert(message).sound("default"));
        conn->submit(apns::Payload(token).badge(1).priority(apns::Priority::Conserve));
        conn->submit(apns::Payload(token)
            .alert(message)
            .custom("thread", "example")
            .expiration(static_cast<uint32_t>(std::time(nullptr) + 3600)));

        // The gateway only answers on failure; give it a moment before hanging up.
        if (closed.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
            conn->disconnect();
        }
        auto result = closed.get();

        std::cout << "closed: " << result.error.message
                  << " (code " << static_cast<int>(result.error.raw_code)
                  << ", notification " << result.error.notification_id << ")" << std::endl;
        if (result.error_payload) {
            std::cout << "rejected: " << result.error_payload->token() << std::endl;
        }
        std::cout << "unsent: " << result.unsent_payloads.size() << std::endl;

        auto stats = conn->stats();
        std::cout << "frames: " << stats.frames_written
                  << ", bytes: " << stats.bytes_written << std::endl;
    } catch (const apns::ApnsError& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

// Full ConnectionConfig builder: all available options with defaults.
//
//   cmake -B build -DAPNS_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/apns_config

#include "apns/apns.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <chrono>
#include <iostream>

int main() {
    auto config = apns::ConnectionConfig::builder()
        .replay_buffer_size(10000)                                // default: 10000 payloads kept for replay
        .max_frame_size(65535)                                    // default: 65535 bytes per frame
        .max_payload_size(256)                                    // default: 256-byte JSON body
        .flush_delay(std::chrono::milliseconds(10))               // default: 10ms after the last submit
        .flush_interval(std::chrono::minutes(5))                  // default: 5min when idle
        .logger(spdlog::stdout_color_mt("apns"))                  // default: discards everything
        .on_error([](const apns::ApnsError& e) {                  // default: errors are silent
            std::cerr << "[apns] " << e.what() << std::endl;
        })
        .build();

    std::cout << "replay buffer: " << config.replay_buffer_size() << std::endl;
    std::cout << "max frame:     " << config.max_frame_size() << std::endl;
    std::cout << "max payload:   " << config.max_payload_size() << std::endl;

    try {
        apns::ConnectionConfig::builder().max_frame_size(100).build();
    } catch (const apns::ApnsError& e) {
        std::cout << "rejected: " << e.what() << std::endl;
    }
}

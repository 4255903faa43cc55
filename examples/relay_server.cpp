#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "wormhole/errors.hpp"
#include "wormhole/relay_server.hpp"

namespace {

std::atomic<bool> stop_requested{false};

void handle_signal(int) {
    stop_requested = true;
}

}  // namespace

int main(int argc, char* argv[]) {
    uint16_t port = 4000;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--port" && i + 1 < argc) {
            int value = std::atoi(argv[++i]);
            if (value <= 0 || value > 65535) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 2;
            }
            port = static_cast<uint16_t>(value);
        } else {
            std::cerr << "Usage: wormhole-relay [--port N]" << std::endl;
            return 2;
        }
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    Wormhole::net::RelayServer server;
    try {
        server.run(port);
    } catch (const Wormhole::Exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "[RELAY] Mailbox on ws://localhost:" << port << "/v1, transit on ws://localhost:" << port
              << "/transit" << std::endl;

    while (!stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[RELAY] Shutting down." << std::endl;
    server.stop();
    return 0;
}

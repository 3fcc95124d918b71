#include "server/server.hpp"
#include "server/server_config.hpp"
#include <asio/io_context.hpp>
#include <csignal>
#include <functional>
#include <iostream>

std::function<void()> shutdown_handler;

void signal_handler(int signal) {
    std::cout << "\nReceived signal " << signal << ", shutting down..." << std::endl;
    if (shutdown_handler) {
        shutdown_handler();
    }
}

int main(int argc, char* argv[]) {
    strata::server::HostConfig config;
    std::string data_dir = argc > 1 ? argv[1] : "data";

    if (!config.load(data_dir)) {
        // Try relative to the build directory
        data_dir = "../data";
        if (!config.load(data_dir)) {
            std::cerr << "Failed to load host config from data/ directory" << std::endl;
            return 1;
        }
    }

    try {
        asio::io_context io_context;

        strata::server::Server server(io_context, config);

        shutdown_handler = [&]() {
            server.stop();
            io_context.stop();
        };

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        server.start();

        std::cout << "Strata host running level '" << config.server().level_name << "'" << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;

        io_context.run();

    } catch (const std::exception& e) {
        std::cerr << "Server error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

/**
 * @file main.cpp
 * @brief chatrelay server entry point
 */

#include "chatrelay/chatrelay.hpp"

#include <csignal>
#include <memory>

// Global server instance for signal handling
static std::unique_ptr<chatrelay::Server> g_server;

static void signal_handler(int signal) {
    CHATRELAY_LOG_INFO("Received signal {}, shutting down...", signal);
    if (g_server) {
        g_server->stop();
    }
}

int main() {
    try {
        chatrelay::ServerOptions options = chatrelay::load_server_options(std::string(".env"));

        chatrelay::Logger::instance().initialize(options.log_level, options.log_dir);
        CHATRELAY_LOG_INFO("chatrelay v{} starting (log level {})",
                           chatrelay::VERSION, chatrelay::log_level_to_string(options.log_level));

        chatrelay::Relay relay(chatrelay::RelayOptions::from_server_options(options));
        relay.start();

        if (options.api_key.empty()) {
            CHATRELAY_LOG_WARN("No API key configured, requests are not authenticated");
        }

        g_server = std::make_unique<chatrelay::Server>(relay, options);
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        g_server->listen();
        g_server.reset();

        CHATRELAY_LOG_INFO("chatrelay shutdown complete");
        return 0;
    } catch (const chatrelay::ChatRelayError& e) {
        CHATRELAY_LOG_CRITICAL("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        CHATRELAY_LOG_CRITICAL("Unhandled exception: {}", e.what());
        return 1;
    }
}

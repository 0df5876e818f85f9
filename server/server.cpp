#include "../nimbridge.h"
#include "server.h"
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

Server::Server(const Config& config, const std::string& server_type)
    : config(config), server_type(server_type) {
}

Server::~Server() {
    shutdown();
}

void Server::shutdown() {
    stop_requested = true;
    if (!running.exchange(false)) {
        return;  // Not running or already shutting down
    }
    LOG_INFO("Server shutdown requested");

    // stop() is a no-op until listen_after_bind() is accepting
    while (listening && !tcp_server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    tcp_server.stop();
}

void Server::register_common_endpoints() {
    // CORS: every response is readable from any origin
    tcp_server.set_default_headers({
        {"Access-Control-Allow-Origin", "*"}
    });

    // CORS preflight
    tcp_server.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
        res.set_header("Access-Control-Max-Age", "86400");
        res.status = 204;
    });

    // GET /health - Health check
    tcp_server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        json response = {
            {"status", "ok"},
            {"service", server_type},
            {"reasoning_display", config.show_reasoning},
            {"thinking_mode", config.thinking_mode}
        };
        res.set_content(response.dump(), "application/json");
    });

    // GET /status - Server status
    tcp_server.Get("/status", [this](const httplib::Request&, httplib::Response& res) {
        auto now = std::chrono::steady_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - start_time).count();

        json status = {
            {"status", "ok"},
            {"server_type", server_type},
            {"uptime_seconds", uptime},
            {"requests_processed", requests_processed.load()},
            {"pid", getpid()}
        };

        add_status_info(status);

        res.set_content(status.dump(), "application/json");
    });

    // Unknown routes
    tcp_server.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (res.status == 404 && res.body.empty()) {
            json error = {
                {"error", {
                    {"message", "Endpoint " + req.path + " not found"},
                    {"code", 404}
                }}
            };
            res.set_content(error.dump(), "application/json");
        }
    });

    tcp_server.set_payload_max_length(config.max_body_size);
}

int Server::run() {
    start_time = std::chrono::steady_clock::now();

    register_common_endpoints();
    register_endpoints();

    if (!tcp_server.bind_to_port(config.host, config.port)) {
        LOG_ERROR("Failed to bind " + server_type + " to " + config.host + ":" + std::to_string(config.port));
        return 1;
    }

    listening = true;
    running = true;
    if (stop_requested) {
        listening = false;
        running = false;
        LOG_INFO(server_type + " stopped before accepting connections");
        return 0;
    }

    LOG_INFO(server_type + " ready on " + config.host + ":" + std::to_string(config.port));

    // Blocks until stopped
    bool success = tcp_server.listen_after_bind();

    listening = false;
    running = false;

    if (!success) {
        LOG_ERROR("Failed to start " + server_type + " on " + config.host + ":" + std::to_string(config.port));
        return 1;
    }

    LOG_INFO(server_type + " stopped");
    return 0;
}

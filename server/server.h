#pragma once

#include "../config.h"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>
#include <atomic>
#include <chrono>

/// @brief Base class for the HTTP front end
/// Owns the httplib server and its lifecycle, and registers the endpoints
/// every server has (/health, /status, CORS preflight, 404 fallback).
class Server {
public:
    Server(const Config& config, const std::string& server_type);
    virtual ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /// @brief Register endpoints and listen; blocks until shutdown()
    /// @return 0 on success, non-zero on error
    int run();

    /// @brief Initiate graceful shutdown (safe from signal-handling threads)
    /// A request that arrives before run() starts accepting makes run() return at once.
    void shutdown();

    bool is_running() const { return running.load(); }

protected:
    /// @brief Register server-specific endpoints on the TCP server
    virtual void register_endpoints() = 0;

    /// @brief Add subclass-specific info to status response
    virtual void add_status_info(nlohmann::json& status) {}

    httplib::Server tcp_server;

    std::atomic<bool> running{false};
    std::atomic<bool> stop_requested{false};
    std::atomic<bool> listening{false};
    std::chrono::steady_clock::time_point start_time;
    std::atomic<uint64_t> requests_processed{0};

    const Config& config;
    std::string server_type;

private:
    void register_common_endpoints();
};

#pragma once

#include "server.h"
#include "../transcoder.h"
#include "../upstream.h"
#include <string>

/// @brief OpenAI-compatible front end that relays to the configured upstream
class APIServer : public Server {
public:
    /// @param upstream Must outlive the server
    APIServer(const Config& config, Upstream& upstream);
    ~APIServer() override;

protected:
    void register_endpoints() override;
    void add_status_info(nlohmann::json& status) override;

private:
    void handle_chat_completions(const httplib::Request& req, httplib::Response& res);

    Transcoder transcoder;
};

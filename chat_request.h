#pragma once

#include "message.h"
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

/// @brief Malformed client request (maps to HTTP 400)
class RequestError : public std::runtime_error {
public:
    explicit RequestError(const std::string& message, int status = 400)
        : std::runtime_error(message), status(status) {}

    int status;
};

/// @brief Inbound chat-completion request, as sent by the client
struct ChatRequest {
    std::string model;                 ///< Public model id
    std::vector<Message> messages;     ///< Full history, chronological
    std::optional<double> temperature;
    std::optional<int> max_tokens;
    bool stream = false;

    /// @brief Parse a request body
    /// @throws RequestError if required fields are missing or mistyped
    static ChatRequest from_json(const nlohmann::json& body);
};

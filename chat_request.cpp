#include "nimbridge.h"
#include "chat_request.h"

#include <climits>
#include <cstdint>

using json = nlohmann::json;

ChatRequest ChatRequest::from_json(const json& body) {
    if (!body.is_object()) {
        throw RequestError("Request body must be a JSON object");
    }

    ChatRequest request;

    if (body.contains("model") && !body["model"].is_null()) {
        if (!body["model"].is_string()) {
            throw RequestError("'model' must be a string");
        }
        request.model = body["model"].get<std::string>();
    }

    if (!body.contains("messages") || !body["messages"].is_array()) {
        throw RequestError("'messages' must be an array");
    }

    request.messages.reserve(body["messages"].size());
    for (size_t i = 0; i < body["messages"].size(); ++i) {
        try {
            request.messages.push_back(Message::from_json(body["messages"][i]));
        } catch (const std::invalid_argument& e) {
            throw RequestError("messages[" + std::to_string(i) + "]: " + e.what());
        }
    }

    if (body.contains("temperature") && !body["temperature"].is_null()) {
        if (!body["temperature"].is_number()) {
            throw RequestError("'temperature' must be a number");
        }
        request.temperature = body["temperature"].get<double>();
    }

    if (body.contains("max_tokens") && !body["max_tokens"].is_null()) {
        if (!body["max_tokens"].is_number_integer()) {
            throw RequestError("'max_tokens' must be an integer");
        }
        const json& value = body["max_tokens"];
        bool in_range = value.is_number_unsigned()
            ? value.get<uint64_t>() >= 1 && value.get<uint64_t>() <= static_cast<uint64_t>(INT_MAX)
            : value.get<int64_t>() >= 1 && value.get<int64_t>() <= INT_MAX;
        if (!in_range) {
            throw RequestError("'max_tokens' must be between 1 and " + std::to_string(INT_MAX));
        }
        request.max_tokens = value.get<int>();
    }

    if (body.contains("stream") && !body["stream"].is_null()) {
        if (!body["stream"].is_boolean()) {
            throw RequestError("'stream' must be a boolean");
        }
        request.stream = body["stream"].get<bool>();
    }

    return request;
}

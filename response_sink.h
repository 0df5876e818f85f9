#pragma once

#include <string>
#include <nlohmann/json.hpp>

/// @brief Destination of one client response
///
/// A response is either a single JSON document (send_json) or an event
/// stream (begin_stream, then write per frame). close() is called exactly
/// once, on every exit path.
class ResponseSink {
public:
    virtual ~ResponseSink() = default;

    /// @brief Send a complete JSON response with the given HTTP status
    virtual void send_json(int status, const nlohmann::json& body) = 0;

    /// @brief Commit event-stream headers; false if the client is already gone
    virtual bool begin_stream() = 0;

    /// @brief Write one wire frame; false once the client can no longer accept data
    virtual bool write(const std::string& data) = 0;

    /// @brief Finish the response and release the connection
    virtual void close() = 0;

    /// @brief True after the client disconnected
    virtual bool cancelled() const { return false; }
};

#pragma once

#include "config.h"
#include "chat_request.h"
#include "content_normalizer.h"
#include "response_sink.h"
#include "upstream.h"
#include <nlohmann/json.hpp>

/// @brief Outcome of one handled request
enum class TranscodeStatus {
    COMPLETED,            ///< Non-streaming response written
    STREAMED,             ///< Event stream relayed to the end
    UPSTREAM_ERROR,       ///< Upstream failed before any data; one error object written
    STREAM_FAILED,        ///< Upstream failed mid-stream; stream closed without an error frame
    CLIENT_DISCONNECTED   ///< Client went away; upstream read aborted
};

const char* to_string(TranscodeStatus status);

/// @brief Per-request transcoder between the client protocol and the upstream
///
/// Holds only immutable state (configuration and the compiled lead-in
/// catalog), so one instance serves concurrent requests. All per-stream
/// state lives on the stack of handle().
class Transcoder {
public:
    Transcoder(const Config& config, Upstream& upstream);

    /// @brief Handle one request end to end, writing the result to @p sink
    /// The sink is closed on every path.
    TranscodeStatus handle(const ChatRequest& request, ResponseSink& sink) const;

    /// @brief Outbound body: windowed history plus provider extensions
    nlohmann::json build_upstream_request(const ChatRequest& request) const;

    /// @brief Client-shaped completion from an upstream non-streaming body
    /// @throws std::runtime_error if the body has no choices array
    nlohmann::json translate_completion(const nlohmann::json& upstream_body,
                                        const std::string& public_model) const;

    /// @brief Structured error object for a failed upstream exchange
    /// @param[out] http_status Status to send to the client
    static nlohmann::json upstream_error(const HttpResponse& response, int& http_status);

    const LeadInCatalog& catalog() const { return lead_ins; }

private:
    TranscodeStatus handle_complete(const ChatRequest& request, const nlohmann::json& body,
                                    ResponseSink& sink) const;
    TranscodeStatus handle_stream(const nlohmann::json& body, ResponseSink& sink) const;

    const Config& config;
    Upstream& upstream;
    LeadInCatalog lead_ins;
};

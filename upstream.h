#pragma once

#include "http_client.h"
#include "config.h"
#include <nlohmann/json.hpp>
#include <map>
#include <string>

/// @brief Upstream chat-completion service
/// The transcoder talks to the upstream only through this interface, so
/// tests can substitute an in-memory implementation.
class Upstream {
public:
    virtual ~Upstream() = default;

    /// @brief Non-streaming call; waits for the full response body
    /// @param abort_check Polled while waiting; true aborts the transfer
    virtual HttpResponse complete(const nlohmann::json& request,
                                  AbortCheck abort_check) = 0;

    /// @brief Streaming call; 2xx body bytes are delivered to @p callback as they arrive
    /// @param abort_check Polled while waiting for bytes; true aborts the transfer
    virtual HttpResponse stream(const nlohmann::json& request,
                                StreamCallback callback,
                                AbortCheck abort_check) = 0;
};

/// @brief Upstream reached over HTTP(S) with libcurl
/// Creates a fresh HttpClient per call, so concurrent requests share nothing.
class HttpUpstream : public Upstream {
public:
    explicit HttpUpstream(const Config& config);

    HttpResponse complete(const nlohmann::json& request,
                          AbortCheck abort_check) override;
    HttpResponse stream(const nlohmann::json& request,
                        StreamCallback callback,
                        AbortCheck abort_check) override;

    std::string get_api_endpoint() const { return api_endpoint; }

private:
    std::map<std::string, std::string> get_api_headers(bool streaming) const;
    void configure(HttpClient& client) const;

    const Config& config;
    std::string api_endpoint;
};

#include "nimbridge.h"
#include "upstream.h"

HttpUpstream::HttpUpstream(const Config& config)
    : config(config) {
    std::string base = config.api_base;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    api_endpoint = base + "/chat/completions";
}

std::map<std::string, std::string> HttpUpstream::get_api_headers(bool streaming) const {
    std::map<std::string, std::string> headers;
    headers["Content-Type"] = "application/json";
    if (!config.api_key.empty()) {
        headers["Authorization"] = "Bearer " + config.api_key;
    }
    if (streaming) {
        headers["Accept"] = "text/event-stream";
    }
    return headers;
}

void HttpUpstream::configure(HttpClient& client) const {
    client.set_timeout(config.upstream_timeout);
    client.set_connect_timeout(config.connect_timeout);
    client.set_ssl_verify(config.ssl_verify);
    if (!config.ca_bundle.empty()) {
        client.set_ca_bundle(config.ca_bundle);
    }
    client.set_verbose(g_debug_level >= 9);
}

HttpResponse HttpUpstream::complete(const nlohmann::json& request,
                                    AbortCheck abort_check) {
    HttpClient client;
    configure(client);
    if (abort_check) {
        client.set_abort_check(std::move(abort_check));
    }
    return client.post(api_endpoint, request.dump(), get_api_headers(false));
}

HttpResponse HttpUpstream::stream(const nlohmann::json& request,
                                  StreamCallback callback,
                                  AbortCheck abort_check) {
    HttpClient client;
    configure(client);
    if (abort_check) {
        client.set_abort_check(std::move(abort_check));
    }
    return client.post_stream(api_endpoint, request.dump(), get_api_headers(true), std::move(callback));
}

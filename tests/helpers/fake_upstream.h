#ifndef FAKE_UPSTREAM_H
#define FAKE_UPSTREAM_H

#include "upstream.h"
#include "response_sink.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace test_helpers {

// One "data: {...}" frame carrying a content delta
inline std::string content_frame(const std::string& text) {
    nlohmann::json payload = {
        {"id", "cmpl-1"},
        {"object", "chat.completion.chunk"},
        {"choices", {{{"index", 0}, {"delta", {{"content", text}}}, {"finish_reason", nullptr}}}}
    };
    return "data: " + payload.dump() + "\n\n";
}

// Frame with an arbitrary delta and finish_reason
inline std::string delta_frame(const nlohmann::json& delta, const nlohmann::json& finish_reason = nullptr) {
    nlohmann::json payload = {
        {"id", "cmpl-1"},
        {"object", "chat.completion.chunk"},
        {"choices", {{{"index", 0}, {"delta", delta}, {"finish_reason", finish_reason}}}}
    };
    return "data: " + payload.dump() + "\n\n";
}

inline std::string done_frame() {
    return "data: [DONE]\n\n";
}

// Upstream that replays canned responses and records what it was sent
class FakeUpstream : public Upstream {
public:
    HttpResponse complete(const nlohmann::json& request,
                          AbortCheck abort_check) override {
        requests.push_back(request);
        if (abort_check && abort_check()) {
            HttpResponse response;
            response.error_message = "Callback aborted";
            response.aborted = true;
            return response;
        }
        return complete_response;
    }

    HttpResponse stream(const nlohmann::json& request,
                        StreamCallback callback,
                        AbortCheck abort_check) override {
        requests.push_back(request);
        HttpResponse response = stream_result;
        for (const auto& chunk : chunks) {
            if (abort_check && abort_check()) {
                response.error_message = "Callback aborted";
                response.aborted = true;
                return response;
            }
            chunks_delivered++;
            if (!callback(chunk, nullptr)) {
                response.error_message = "Failed writing received data to disk/application";
                response.aborted = true;
                return response;
            }
        }
        return response;
    }

    HttpResponse complete_response;
    HttpResponse stream_result;         // returned once all chunks are delivered
    std::vector<std::string> chunks;    // 2xx body chunks, in arrival order
    std::vector<nlohmann::json> requests;
    size_t chunks_delivered = 0;
};

// Sink that records everything written to it
class RecordingSink : public ResponseSink {
public:
    void send_json(int status, const nlohmann::json& body) override {
        json_status = status;
        json_body = body;
        json_count++;
    }

    bool begin_stream() override {
        if (disconnected) return false;
        stream_started = true;
        return true;
    }

    bool write(const std::string& data) override {
        if (disconnected) return false;
        frames.push_back(data);
        if (disconnect_after_writes > 0 && frames.size() >= disconnect_after_writes) {
            disconnected = true;
        }
        return true;
    }

    void close() override {
        close_count++;
    }

    bool cancelled() const override {
        return disconnected;
    }

    // Concatenated content of every data frame written so far
    std::string streamed_content() const {
        std::string out;
        for (const auto& frame : frames) {
            if (frame.compare(0, 6, "data: ") != 0) continue;
            auto payload = nlohmann::json::parse(frame.substr(6), nullptr, false);
            if (payload.is_discarded() || !payload.contains("choices")) continue;
            for (const auto& choice : payload["choices"]) {
                if (choice.contains("delta") && choice["delta"].contains("content") &&
                    choice["delta"]["content"].is_string()) {
                    out += choice["delta"]["content"].get<std::string>();
                }
            }
        }
        return out;
    }

    int json_status = 0;
    nlohmann::json json_body;
    int json_count = 0;
    bool stream_started = false;
    std::vector<std::string> frames;
    int close_count = 0;
    bool disconnected = false;
    size_t disconnect_after_writes = 0;  // 0 = never
};

} // namespace test_helpers

#endif // FAKE_UPSTREAM_H

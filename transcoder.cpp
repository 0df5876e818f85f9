#include "nimbridge.h"
#include "transcoder.h"
#include "event_reframer.h"
#include "history_window.h"

#include <optional>

using json = nlohmann::json;

const char* to_string(TranscodeStatus status) {
    switch (status) {
        case TranscodeStatus::COMPLETED: return "completed";
        case TranscodeStatus::STREAMED: return "streamed";
        case TranscodeStatus::UPSTREAM_ERROR: return "upstream_error";
        case TranscodeStatus::STREAM_FAILED: return "stream_failed";
        case TranscodeStatus::CLIENT_DISCONNECTED: return "client_disconnected";
        default: return "unknown";
    }
}

namespace {

/// Per-stream state: reframer, normalizer and the frames held back while the
/// normalizer is still collecting its lead-in window. Lives for exactly one
/// streamed request.
class StreamRelay {
public:
    StreamRelay(ResponseSink& sink, bool show_reasoning,
                const LeadInCatalog& catalog, size_t threshold)
        : sink(sink), reframer(show_reasoning), normalizer(catalog, threshold) {}

    /// Transport chunk handler
    bool on_chunk(const std::string& chunk) {
        if (!started) {
            if (!sink.begin_stream()) {
                client_gone = true;
                return false;
            }
            started = true;
        }

        bool keep_going = reframer.process_chunk(chunk, [this](const ProtocolEvent& event) {
            return on_event(event);
        });

        // Nothing after the sentinel is read
        return keep_going && !reframer.terminated();
    }

    /// Transport end (clean or not): discard the partial line, release held content
    void finish() {
        reframer.finish();
        if (!client_gone && !reframer.terminated()) {
            flush_pending();
        }
    }

    bool started = false;
    bool client_gone = false;

private:
    bool on_event(const ProtocolEvent& event) {
        if (event.type == ProtocolEvent::DONE) {
            if (!flush_pending()) {
                return false;
            }
            return emit(event);
        }

        if (normalizer.state() == ContentNormalizer::PASSTHROUGH) {
            return emit(event);
        }

        std::optional<std::string> fragment = event.content();
        if (!fragment || fragment->empty()) {
            // Keep order behind content that is still being collected
            if (carrier) {
                held.push_back(event);
                return true;
            }
            return emit(event);
        }

        if (!carrier) {
            carrier = event;
        } else {
            ProtocolEvent rest = event;
            rest.set_content(std::nullopt);
            if (carries_more_than_content(rest)) {
                held.push_back(std::move(rest));
            }
        }

        std::optional<std::string> released = normalizer.push(*fragment);
        if (released) {
            return release(*released);
        }
        return true;
    }

    // Emit the carrier with the cleaned text, then everything queued behind it
    bool release(const std::string& text) {
        if (carrier) {
            carrier->set_content(text);
            bool ok = emit(*carrier);
            carrier.reset();
            if (!ok) {
                held.clear();
                return false;
            }
        }
        for (const auto& event : held) {
            if (!emit(event)) {
                held.clear();
                return false;
            }
        }
        held.clear();
        return true;
    }

    bool flush_pending() {
        std::optional<std::string> remainder = normalizer.finish();
        if (remainder || carrier || !held.empty()) {
            return release(remainder.value_or(""));
        }
        return true;
    }

    static bool carries_more_than_content(const ProtocolEvent& event) {
        if (event.has_finish_reason()) {
            return true;
        }
        const json& payload = event.payload;
        if (!payload.is_object() || !payload.contains("choices") || !payload["choices"].is_array()) {
            return true;
        }
        const json& choices = payload["choices"];
        if (choices.size() != 1 || !choices[0].is_object()) {
            return true;
        }
        const json& choice = choices[0];
        if (!choice.contains("delta") || !choice["delta"].is_object()) {
            return false;
        }
        for (const auto& [key, value] : choice["delta"].items()) {
            if (key != "role" && !value.is_null()) {
                return true;
            }
        }
        return payload.contains("usage") && !payload["usage"].is_null();
    }

    bool emit(const ProtocolEvent& event) {
        if (client_gone) {
            return false;
        }
        if (!sink.write(event.to_wire())) {
            LOG_DEBUG("Client stopped accepting stream data");
            client_gone = true;
            return false;
        }
        return true;
    }

    ResponseSink& sink;
    EventReframer reframer;
    ContentNormalizer normalizer;
    std::optional<ProtocolEvent> carrier;  // first content frame of the lead-in window
    std::vector<ProtocolEvent> held;       // frames that arrived behind the carrier
};

} // namespace

Transcoder::Transcoder(const Config& config, Upstream& upstream)
    : config(config), upstream(upstream), lead_ins(config.lead_in_patterns) {
}

json Transcoder::build_upstream_request(const ChatRequest& request) const {
    std::vector<Message> window = select_window(request.messages, config.token_budget);

    json messages = json::array();
    for (const auto& msg : window) {
        messages.push_back(msg.wire);
    }

    json body = {
        {"model", config.upstream_model(request.model)},
        {"messages", messages},
        {"temperature", request.temperature.value_or(config.default_temperature)},
        {"max_tokens", request.max_tokens.value_or(config.default_max_tokens)},
        {"stream", request.stream}
    };

    if (config.thinking_mode) {
        body["extra_body"] = {{"chat_template_kwargs", {{"thinking", true}}}};
    }

    return body;
}

json Transcoder::upstream_error(const HttpResponse& response, int& http_status) {
    std::string type;
    std::string message;

    if (response.timed_out) {
        http_status = 500;
        type = "upstream_timeout";
        message = "Upstream request timed out";
    } else if (!response.error_message.empty()) {
        http_status = 500;
        type = "upstream_transport_error";
        message = response.error_message;
    } else {
        http_status = response.status_code >= 400 ? static_cast<int>(response.status_code) : 500;
        type = "upstream_status_error";
        message = "Request failed with status code " + std::to_string(response.status_code);

        // Surface the upstream's own explanation when it sent one
        json detail = json::parse(response.body, nullptr, false);
        if (detail.is_object()) {
            if (detail.contains("error") && detail["error"].is_object() &&
                detail["error"].contains("message") && detail["error"]["message"].is_string()) {
                message += ": " + detail["error"]["message"].get<std::string>();
            } else if (detail.contains("detail") && detail["detail"].is_string()) {
                message += ": " + detail["detail"].get<std::string>();
            }
        }
    }

    return json{
        {"error", {
            {"message", message},
            {"type", type},
            {"code", http_status}
        }}
    };
}

json Transcoder::translate_completion(const json& upstream_body, const std::string& public_model) const {
    if (!upstream_body.is_object() || !upstream_body.contains("choices") ||
        !upstream_body["choices"].is_array()) {
        throw std::runtime_error("Upstream response has no choices");
    }

    json choices = json::array();
    for (const auto& choice : upstream_body["choices"]) {
        json message = choice.value("message", json::object());
        json content = message.contains("content") ? message["content"] : json();

        // Empty or missing content is forwarded unchanged
        if (content.is_string() && !content.get<std::string>().empty()) {
            content = lead_ins.strip(content.get<std::string>());
        }

        if (config.show_reasoning && message.contains("reasoning_content") &&
            message["reasoning_content"].is_string() &&
            !message["reasoning_content"].get<std::string>().empty()) {
            std::string text = content.is_string() ? content.get<std::string>() : "";
            content = "<think>\n" + message["reasoning_content"].get<std::string>() +
                      "\n</think>\n\n" + text;
        }

        json out_message = {
            {"role", message.value("role", "assistant")},
            {"content", content}
        };
        if (message.contains("tool_calls")) {
            out_message["tool_calls"] = message["tool_calls"];
        }

        choices.push_back({
            {"index", choice.value("index", static_cast<int>(choices.size()))},
            {"message", out_message},
            {"finish_reason", choice.contains("finish_reason") ? choice["finish_reason"] : json()}
        });
    }

    json usage = upstream_body.contains("usage") && upstream_body["usage"].is_object()
        ? upstream_body["usage"]
        : json{{"prompt_tokens", 0}, {"completion_tokens", 0}, {"total_tokens", 0}};

    return json{
        {"id", "chatcmpl-" + std::to_string(nimbridge::get_current_timestamp_ms())},
        {"object", "chat.completion"},
        {"created", nimbridge::get_current_timestamp()},
        {"model", public_model},
        {"choices", choices},
        {"usage", usage}
    };
}

TranscodeStatus Transcoder::handle(const ChatRequest& request, ResponseSink& sink) const {
    json body = build_upstream_request(request);

    LOG_DEBUG("Forwarding " + std::to_string(body["messages"].size()) + "/" +
              std::to_string(request.messages.size()) + " messages to " +
              body["model"].get<std::string>() + " (stream=" +
              (request.stream ? "true" : "false") + ")");

    TranscodeStatus status = request.stream
        ? handle_stream(body, sink)
        : handle_complete(request, body, sink);

    LOG_DEBUG(std::string("Request finished: ") + to_string(status));
    return status;
}

TranscodeStatus Transcoder::handle_complete(const ChatRequest& request, const json& body,
                                            ResponseSink& sink) const {
    HttpResponse response = upstream.complete(body, [&sink]() { return sink.cancelled(); });

    if (response.aborted || sink.cancelled()) {
        LOG_DEBUG("Client disconnected before the completion was ready");
        sink.close();
        return TranscodeStatus::CLIENT_DISCONNECTED;
    }

    if (!response.is_success()) {
        int http_status = 500;
        json error = upstream_error(response, http_status);
        LOG_ERROR("Upstream error: " + error["error"]["message"].get<std::string>());
        sink.send_json(http_status, error);
        sink.close();
        return TranscodeStatus::UPSTREAM_ERROR;
    }

    json result;
    try {
        result = translate_completion(json::parse(response.body), request.model);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Undecodable upstream response: ") + e.what());
        json error = {
            {"error", {
                {"message", std::string("Invalid upstream response: ") + e.what()},
                {"type", "upstream_decode_error"},
                {"code", 500}
            }}
        };
        sink.send_json(500, error);
        sink.close();
        return TranscodeStatus::UPSTREAM_ERROR;
    }

    sink.send_json(200, result);
    sink.close();
    return TranscodeStatus::COMPLETED;
}

TranscodeStatus Transcoder::handle_stream(const json& body, ResponseSink& sink) const {
    StreamRelay relay(sink, config.show_reasoning, lead_ins, config.normalize_threshold);

    HttpResponse response = upstream.stream(
        body,
        [&relay](const std::string& chunk, void*) { return relay.on_chunk(chunk); },
        [&sink]() { return sink.cancelled(); });

    if (!relay.started) {
        if (sink.cancelled()) {
            sink.close();
            return TranscodeStatus::CLIENT_DISCONNECTED;
        }
        if (!response.is_success()) {
            // Nothing streamed yet: report once, as a structured error
            int http_status = 500;
            json error = upstream_error(response, http_status);
            LOG_ERROR("Upstream error: " + error["error"]["message"].get<std::string>());
            sink.send_json(http_status, error);
            sink.close();
            return TranscodeStatus::UPSTREAM_ERROR;
        }
        // 2xx with an empty body
        if (!sink.begin_stream()) {
            sink.close();
            return TranscodeStatus::CLIENT_DISCONNECTED;
        }
        sink.close();
        return TranscodeStatus::STREAMED;
    }

    relay.finish();
    sink.close();

    if (relay.client_gone || sink.cancelled()) {
        LOG_INFO("Client disconnected, upstream read aborted");
        return TranscodeStatus::CLIENT_DISCONNECTED;
    }

    if (!response.error_message.empty() && !response.aborted) {
        // Mid-stream failure: the client already has partial data, no error frame
        LOG_WARN("Upstream stream ended abnormally: " + response.error_message);
        return TranscodeStatus::STREAM_FAILED;
    }

    return TranscodeStatus::STREAMED;
}

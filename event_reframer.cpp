#include "nimbridge.h"
#include "event_reframer.h"

using json = nlohmann::json;

static const std::string DATA_PREFIX = "data:";
static const std::string DONE_SENTINEL = "[DONE]";

std::optional<std::string> ProtocolEvent::content() const {
    if (type != DATA || !payload.is_object()) {
        return std::nullopt;
    }
    auto choices = payload.find("choices");
    if (choices == payload.end() || !choices->is_array() || choices->empty()) {
        return std::nullopt;
    }
    const json& choice = (*choices)[0];
    if (!choice.is_object() || !choice.contains("delta") || !choice["delta"].is_object()) {
        return std::nullopt;
    }
    const json& delta = choice["delta"];
    if (!delta.contains("content") || !delta["content"].is_string()) {
        return std::nullopt;
    }
    return delta["content"].get<std::string>();
}

void ProtocolEvent::set_content(const std::optional<std::string>& text) {
    if (type != DATA || !payload.is_object()) {
        return;
    }
    auto choices = payload.find("choices");
    if (choices == payload.end() || !choices->is_array() || choices->empty()) {
        return;
    }
    json& choice = (*choices)[0];
    if (!choice.is_object()) {
        return;
    }
    if (text) {
        choice["delta"]["content"] = *text;
    } else if (choice.contains("delta") && choice["delta"].is_object()) {
        choice["delta"].erase("content");
    }
}

bool ProtocolEvent::has_finish_reason() const {
    if (type != DATA || !payload.is_object() || !payload.contains("choices") ||
        !payload["choices"].is_array()) {
        return false;
    }
    for (const auto& choice : payload["choices"]) {
        if (choice.is_object() && choice.contains("finish_reason") && !choice["finish_reason"].is_null()) {
            return true;
        }
    }
    return false;
}

std::string ProtocolEvent::to_wire() const {
    switch (type) {
        case DONE:
            return "data: " + DONE_SENTINEL + "\n\n";
        case RAW:
            return raw + "\n\n";
        case DATA:
        default:
            return "data: " + payload.dump(-1, ' ', false, json::error_handler_t::replace) + "\n\n";
    }
}

EventReframer::EventReframer(bool show_reasoning)
    : show_reasoning_(show_reasoning) {
}

void EventReframer::strip_reasoning(json& payload) {
    if (!payload.is_object() || !payload.contains("choices") || !payload["choices"].is_array()) {
        return;
    }
    for (auto& choice : payload["choices"]) {
        if (!choice.is_object()) {
            continue;
        }
        if (choice.contains("delta") && choice["delta"].is_object()) {
            choice["delta"].erase("reasoning_content");
        }
        if (choice.contains("message") && choice["message"].is_object()) {
            choice["message"].erase("reasoning_content");
        }
    }
}

std::optional<ProtocolEvent> EventReframer::decode_line(const std::string& line, bool show_reasoning) {
    if (line.compare(0, DATA_PREFIX.size(), DATA_PREFIX) != 0) {
        // Blank separators, ": keepalive" comments, event:/id: fields
        return std::nullopt;
    }

    std::string value = line.substr(DATA_PREFIX.size());
    if (!value.empty() && value[0] == ' ') {
        value.erase(0, 1);
    }

    ProtocolEvent event;

    size_t first = value.find_first_not_of(" \t");
    size_t last = value.find_last_not_of(" \t");
    if (first != std::string::npos &&
        value.compare(first, last - first + 1, DONE_SENTINEL) == 0) {
        event.type = ProtocolEvent::DONE;
        return event;
    }

    try {
        event.payload = json::parse(value);
        event.type = ProtocolEvent::DATA;
        if (!show_reasoning) {
            strip_reasoning(event.payload);
        }
    } catch (const json::parse_error& e) {
        LOG_DEBUG("Undecodable event line forwarded verbatim: " + std::string(e.what()));
        event.type = ProtocolEvent::RAW;
        event.payload = json();
        event.raw = line;
    }
    return event;
}

bool EventReframer::process_chunk(const std::string& chunk, EventCallback callback) {
    if (terminated_ || chunk.empty()) {
        return true;
    }

    buffer_ += chunk;

    size_t pos = 0;
    size_t newline_pos;

    while ((newline_pos = buffer_.find('\n', pos)) != std::string::npos) {
        // Handle both \n and \r\n
        size_t line_end = newline_pos;
        if (line_end > pos && buffer_[line_end - 1] == '\r') {
            line_end--;
        }

        std::string line = buffer_.substr(pos, line_end - pos);
        pos = newline_pos + 1;

        dprintf(3, "event line: %s", line.c_str());

        auto event = decode_line(line, show_reasoning_);
        if (!event) {
            continue;
        }

        if (event->type == ProtocolEvent::DONE) {
            terminated_ = true;
            buffer_.clear();
            LOG_DEBUG("Event stream termination sentinel received");
            return callback(*event);
        }

        if (!callback(*event)) {
            buffer_.erase(0, pos);
            return false;
        }
    }

    // Keep the unterminated tail for the next chunk
    buffer_.erase(0, pos);
    return true;
}

void EventReframer::finish() {
    if (!buffer_.empty()) {
        LOG_DEBUG("Discarding " + std::to_string(buffer_.size()) +
                  " bytes of unterminated trailing line at end of stream");
        buffer_.clear();
    }
}

void EventReframer::reset() {
    buffer_.clear();
    terminated_ = false;
}

#pragma once

#include <string>
#include <functional>
#include <optional>
#include <nlohmann/json.hpp>

/// @brief One decoded line of an upstream event stream
struct ProtocolEvent {
    enum Type {
        DATA,  ///< "data: <json>" with a decoded payload
        RAW,   ///< "data: ..." line whose payload did not decode; forwarded verbatim
        DONE   ///< "data: [DONE]" termination sentinel
    };

    Type type = DATA;
    nlohmann::json payload;  ///< Decoded payload (DATA only)
    std::string raw;         ///< Original line (RAW only)

    /// @brief Content fragment of the first choice's delta, if it carries one
    std::optional<std::string> content() const;

    /// @brief Replace (or remove, when @p text is nullopt) the first choice's delta content
    void set_content(const std::optional<std::string>& text);

    /// @brief True if any choice carries a non-null finish_reason
    bool has_finish_reason() const;

    /// @brief Client wire form, terminated by a blank line
    std::string to_wire() const;
};

/// @brief Reframes an upstream byte stream into protocol events
///
/// Chunks arrive with arbitrary boundaries. Complete lines are decoded as
/// they appear; the unterminated tail is carried into the next chunk. After
/// the termination sentinel no further lines are processed.
class EventReframer {
public:
    /// @brief Called once per event, in stream order
    /// @return true to continue, false to stop (downstream gone)
    using EventCallback = std::function<bool(const ProtocolEvent& event)>;

    /// @param show_reasoning When false, reasoning_content is stripped from every decoded payload
    explicit EventReframer(bool show_reasoning = false);
    ~EventReframer() = default;

    /// @brief Process a chunk of raw bytes from the transport
    /// @param chunk Raw bytes in arrival order
    /// @param callback Function called for each complete event
    /// @return false if the callback requested stop, true otherwise
    bool process_chunk(const std::string& chunk, EventCallback callback);

    /// @brief Signal transport end-of-stream; any unterminated tail is discarded
    void finish();

    /// @brief Reset parser state (clears buffer and termination flag)
    void reset();

    /// @brief True once the termination sentinel has been seen
    bool terminated() const { return terminated_; }

    /// @brief Check if an incomplete line is buffered
    bool has_buffered_data() const { return !buffer_.empty(); }

    /// @brief Decode one complete line (no trailing newline)
    /// @return nullopt for lines that are not events (blank lines, comments, other fields)
    static std::optional<ProtocolEvent> decode_line(const std::string& line, bool show_reasoning);

    /// @brief Remove reasoning_content from every choice's delta and message
    static void strip_reasoning(nlohmann::json& payload);

private:
    bool show_reasoning_;
    bool terminated_ = false;
    std::string buffer_;  ///< Unterminated tail of the previous chunk
};

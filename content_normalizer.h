#pragma once

#include <string>
#include <vector>
#include <regex>
#include <optional>
#include <stdexcept>

/// @brief Ordered, immutable catalog of lead-in phrase patterns
///
/// Each pattern is a case-insensitive regular expression matched at the
/// start of the text. strip() removes matches repeatedly, re-applying the
/// whole catalog after every removal, until nothing matches or the text
/// is empty.
class LeadInCatalog {
public:
    LeadInCatalog() = default;

    /// @throws std::invalid_argument if a pattern is not a valid regular expression
    explicit LeadInCatalog(const std::vector<std::string>& patterns);

    /// @brief Remove chained lead-in phrases from the start of @p text
    std::string strip(const std::string& text) const;

    size_t size() const { return patterns_.size(); }
    bool empty() const { return patterns_.empty(); }

    /// @brief Default phrase catalog used when the configuration supplies none
    static const std::vector<std::string>& default_patterns();

    /// @brief Bytes at the head of the text a single pattern match may examine
    static constexpr size_t MATCH_WINDOW = 256;

private:
    struct Pattern {
        std::string source;
        std::regex re;
    };
    std::vector<Pattern> patterns_;
};

/// @brief Per-stream lead-in stripper
///
/// Starts ACCUMULATING: fragments are buffered until the buffer holds at
/// least the threshold number of characters, then the buffer is cleaned
/// once and released as a single fragment and the normalizer switches to
/// PASSTHROUGH for the rest of the stream. The switch happens once and is
/// never undone.
class ContentNormalizer {
public:
    enum State {
        ACCUMULATING,
        PASSTHROUGH
    };

    /// @param catalog Must outlive the normalizer
    /// @param threshold Characters (UTF-8 code points) to collect before the first release
    ContentNormalizer(const LeadInCatalog& catalog, size_t threshold);

    /// @brief Feed one content fragment
    /// @return Text to emit downstream now, or nullopt while still accumulating
    std::optional<std::string> push(const std::string& fragment);

    /// @brief End of stream: release whatever is still accumulated
    /// @return Cleaned remainder, or nullopt if nothing was pending
    std::optional<std::string> finish();

    State state() const { return state_; }
    size_t buffered_chars() const { return char_count_; }
    bool has_pending() const { return state_ == ACCUMULATING && !buffer_.empty(); }

    /// @brief Number of UTF-8 code points in @p text
    static size_t utf8_length(const std::string& text);

private:
    const LeadInCatalog& catalog_;
    size_t threshold_;
    State state_ = ACCUMULATING;
    std::string buffer_;
    size_t char_count_ = 0;
};

#include "nimbridge.h"
#include "content_normalizer.h"

LeadInCatalog::LeadInCatalog(const std::vector<std::string>& patterns) {
    patterns_.reserve(patterns.size());
    for (const auto& source : patterns) {
        try {
            patterns_.push_back({source, std::regex(source, std::regex::ECMAScript | std::regex::icase)});
        } catch (const std::regex_error& e) {
            throw std::invalid_argument("Invalid lead-in pattern '" + source + "': " + e.what());
        }
    }
}

const std::vector<std::string>& LeadInCatalog::default_patterns() {
    static const std::vector<std::string> patterns = {
        R"(^(sure|certainly|absolutely|of course|okay|ok|alright|all right)\b[ \t]*[,!.:;]*\s*)",
        R"(^(great|good|excellent) question\b[ \t]*[,!.:;]*\s*)",
        R"(^(i'd|i would|i'll|i will) be (happy|glad) to help( you)?( with that)?\b[ \t]*[,!.:;]*\s*)",
        R"(^here(?:'|’)?s\s+)",
        R"(^as an ai( language model)?\b[ \t]*,?\s*)",
    };
    return patterns;
}

std::string LeadInCatalog::strip(const std::string& text) const {
    std::string result = text;
    bool stripped = true;

    while (stripped && !result.empty()) {
        stripped = false;

        // libstdc++ regex recursion grows with match length; only look at the head
        std::string head = result.substr(0, MATCH_WINDOW);

        for (const auto& pattern : patterns_) {
            std::smatch match;
            if (std::regex_search(head, match, pattern.re, std::regex_constants::match_continuous) &&
                match.position(0) == 0 && match.length(0) > 0) {
                size_t length = static_cast<size_t>(match.length(0));
                dprintf(2, "lead-in '%s' matched %d bytes", pattern.source.c_str(),
                        static_cast<int>(length));
                result.erase(0, length);
                if (length == head.size()) {
                    // Match ran to the window edge: drop the rest of a whitespace run
                    size_t next = result.find_first_not_of(" \t\r\n");
                    result.erase(0, next == std::string::npos ? result.size() : next);
                }
                stripped = true;
                break;
            }
        }
    }
    return result;
}

ContentNormalizer::ContentNormalizer(const LeadInCatalog& catalog, size_t threshold)
    : catalog_(catalog), threshold_(threshold) {
}

size_t ContentNormalizer::utf8_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        // Count every byte that is not a continuation byte
        if ((c & 0xC0) != 0x80) {
            count++;
        }
    }
    return count;
}

std::optional<std::string> ContentNormalizer::push(const std::string& fragment) {
    if (state_ == PASSTHROUGH) {
        return fragment;
    }

    buffer_ += fragment;
    char_count_ += utf8_length(fragment);

    if (char_count_ < threshold_) {
        return std::nullopt;
    }

    std::string cleaned = catalog_.strip(buffer_);
    LOG_DEBUG("Lead-in window closed after " + std::to_string(char_count_) + " chars (" +
              std::to_string(buffer_.size() - cleaned.size()) + " bytes stripped)");
    buffer_.clear();
    state_ = PASSTHROUGH;
    return cleaned;
}

std::optional<std::string> ContentNormalizer::finish() {
    if (state_ == PASSTHROUGH) {
        return std::nullopt;
    }
    state_ = PASSTHROUGH;
    if (buffer_.empty()) {
        return std::nullopt;
    }
    std::string cleaned = catalog_.strip(buffer_);
    buffer_.clear();
    return cleaned;
}

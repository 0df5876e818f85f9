#include "nimbridge.h"
#include "history_window.h"

#include <algorithm>

static constexpr int BYTES_PER_TOKEN = 4;

int estimate_tokens(const Message& msg) {
    size_t bytes = msg.serialize().size();
    return static_cast<int>((bytes + BYTES_PER_TOKEN - 1) / BYTES_PER_TOKEN);
}

std::vector<Message> select_window(const std::vector<Message>& history, int budget) {
    std::vector<Message> window;
    if (history.empty() || budget <= 0) {
        return window;
    }

    int total_tokens = 0;
    size_t first_kept = history.size();

    for (size_t i = history.size(); i-- > 0;) {
        int tokens = estimate_tokens(history[i]);
        if (total_tokens + tokens > budget) {
            LOG_DEBUG("History window stops at message " + std::to_string(i) +
                      " (" + std::to_string(tokens) + " tokens, " +
                      std::to_string(total_tokens) + "/" + std::to_string(budget) + " used)");
            break;
        }
        total_tokens += tokens;
        first_kept = i;
    }

    window.assign(history.begin() + static_cast<std::ptrdiff_t>(first_kept), history.end());

    if (window.size() < history.size()) {
        LOG_INFO("History trimmed from " + std::to_string(history.size()) + " to " +
                 std::to_string(window.size()) + " messages (" +
                 std::to_string(total_tokens) + " estimated tokens, budget " +
                 std::to_string(budget) + ")");

        long dropped_system = std::count_if(history.begin(),
                                            history.begin() + static_cast<std::ptrdiff_t>(first_kept),
                                            [](const Message& msg) { return msg.role == Message::SYSTEM; });
        if (dropped_system > 0) {
            LOG_WARN("History window dropped " + std::to_string(dropped_system) +
                     " system message(s); upstream will not see them");
        }
    }
    return window;
}

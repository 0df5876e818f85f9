#pragma once

#include "message.h"
#include <vector>

/// @brief Approximate token cost of a message
/// Byte length of the message's serialized form divided by 4, rounded up.
/// A budget-shaping heuristic, not a tokenizer.
int estimate_tokens(const Message& msg);

/// @brief Select the most recent messages that fit a token budget
///
/// Walks the history from newest to oldest and keeps messages while the
/// running total stays within @p budget. The walk stops at the first message
/// that does not fit; older messages are never considered after that, so a
/// newest message that alone exceeds the budget yields an empty window.
///
/// @param history Conversation in chronological order
/// @param budget Maximum summed token estimate of the result
/// @return Contiguous suffix of @p history, in chronological order
std::vector<Message> select_window(const std::vector<Message>& history, int budget);

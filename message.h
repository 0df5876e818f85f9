#pragma once

#include <string>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

/// @brief Represents a single message in the conversation history
/// Built from the client's request body and forwarded upstream unchanged.
/// The wire object is kept as received so fields we do not interpret
/// (name, tool_calls, tool_call_id, ...) survive the round trip.
struct Message {
	enum Role {
		SYSTEM,
		USER,
		ASSISTANT,
		TOOL_RESPONSE,  // modern "tool" role
		FUNCTION,       // legacy OpenAI function result
		OTHER           // any role string we don't recognise
	};

	Role role = USER;
	nlohmann::json content;  // string, array of content parts, or null
	nlohmann::json wire;     // full message object as received

	Message() = default;
	Message(Role r, const std::string& c) : role(r), content(c) {
		wire = {{"role", role_to_string(r)}, {"content", c}};
	}

	/// @brief Build a message from its JSON wire object
	/// @throws std::invalid_argument if the value is not an object with a string role
	static Message from_json(const nlohmann::json& j) {
		if (!j.is_object()) {
			throw std::invalid_argument("message must be an object");
		}
		if (!j.contains("role") || !j["role"].is_string()) {
			throw std::invalid_argument("message is missing a string 'role'");
		}
		Message m;
		m.role = stringToRole(j["role"].get<std::string>());
		m.content = j.contains("content") ? j["content"] : nlohmann::json();
		m.wire = j;
		return m;
	}

	/// @brief Canonical serialized form (what is sent upstream and what tokens are estimated from)
	std::string serialize() const {
		return wire.dump();
	}

	/// @brief Plain text of the content; text parts of structured content are joined with newlines
	std::string text() const {
		if (content.is_string()) {
			return content.get<std::string>();
		}
		std::string out;
		if (content.is_array()) {
			for (const auto& part : content) {
				if (part.is_object() && part.value("type", "") == "text" &&
				    part.contains("text") && part["text"].is_string()) {
					if (!out.empty()) out += "\n";
					out += part["text"].get<std::string>();
				}
			}
		}
		return out;
	}

	static Role stringToRole(const std::string& roleStr) {
		if (roleStr == "system") return SYSTEM;
		if (roleStr == "user") return USER;
		if (roleStr == "assistant") return ASSISTANT;
		if (roleStr == "tool") return TOOL_RESPONSE;
		if (roleStr == "function") return FUNCTION;
		return OTHER;
	}

	static std::string role_to_string(Role r) {
		switch (r) {
			case SYSTEM: return "system";
			case USER: return "user";
			case ASSISTANT: return "assistant";
			case TOOL_RESPONSE: return "tool";
			case FUNCTION: return "function";
			default: return "user";
		}
	}

	/// @brief Role string as it appeared on the wire
	std::string get_role() const {
		if (wire.contains("role") && wire["role"].is_string()) {
			return wire["role"].get<std::string>();
		}
		return role_to_string(role);
	}
};

inline std::ostream& operator<<(std::ostream& os, const Message& msg) {
	std::string body = msg.text();
	os << msg.get_role() << ": ";
	if (body.length() > 100) {
		os << body.substr(0, 100) << "...";
	} else {
		os << body;
	}
	return os;
}

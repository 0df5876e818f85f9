#include "nimbridge.h"
#include "config.h"
#include "content_normalizer.h"

#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

Config::Config() {
    set_defaults();
}

void Config::set_max_body_size(const std::string& size_str) {
    max_body_size_str = size_str;
    max_body_size = parse_size_string(size_str);
}

void Config::set_defaults() {
    api_base = "https://integrate.api.nvidia.com/v1";
    api_key = "";
    upstream_timeout = 600;  // some upstream models take minutes
    connect_timeout = 30;
    ssl_verify = true;
    ca_bundle = "";

    token_budget = 8000;

    normalize_threshold = 48;
    lead_in_patterns = LeadInCatalog::default_patterns();

    show_reasoning = false;
    thinking_mode = true;
    default_temperature = 0.8;
    default_max_tokens = 16384;

    models = {
        {"gpt-3.5-turbo", "meta/llama-3.3-70b-instruct"},
        {"gpt-4", "nvidia/llama-3.1-nemotron-70b-instruct"},
        {"gpt-4-turbo", "qwen/qwen2.5-72b-instruct"},
        {"gpt-4o", "deepseek-ai/deepseek-v3.1-terminus"},
        {"claude-3-opus", "meta/llama-3.1-405b-instruct"},
        {"claude-3-sonnet", "meta/llama-3.3-70b-instruct"},
        {"gemini-pro", "nvidia/llama-3.1-nemotron-ultra-253b-v1"}
    };
    fallback_model = "meta/llama-3.1-70b-instruct";

    host = "0.0.0.0";
    port = 3000;
    max_body_size_str = "100M";
    max_body_size = parse_size_string(max_body_size_str);
    log_level = "info";
}

size_t Config::parse_size_string(const std::string& size_str) {
    if (size_str.empty()) {
        throw ConfigError("Empty size string");
    }

    // Plain byte count
    bool all_digits = std::all_of(size_str.begin(), size_str.end(),
                                  [](unsigned char c) { return std::isdigit(c) != 0; });
    if (all_digits) {
        return std::stoull(size_str);
    }

    // Number + suffix
    size_t pos = 0;
    while (pos < size_str.length() && (std::isdigit(static_cast<unsigned char>(size_str[pos])) || size_str[pos] == '.')) {
        pos++;
    }

    if (pos == 0) {
        throw ConfigError("Invalid size string (no number): " + size_str);
    }

    double value = 0;
    try {
        value = std::stod(size_str.substr(0, pos));
    } catch (const std::exception&) {
        throw ConfigError("Invalid size string (bad number): " + size_str);
    }
    std::string suffix = size_str.substr(pos);

    suffix.erase(std::remove_if(suffix.begin(), suffix.end(),
                                [](unsigned char c) { return std::isspace(c) != 0; }),
                 suffix.end());
    std::transform(suffix.begin(), suffix.end(), suffix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    size_t multiplier = 1;
    if (suffix.empty() || suffix == "B") {
        multiplier = 1;
    } else if (suffix == "K" || suffix == "KB") {
        multiplier = 1024;
    } else if (suffix == "M" || suffix == "MB") {
        multiplier = 1024 * 1024;
    } else if (suffix == "G" || suffix == "GB") {
        multiplier = 1024ULL * 1024 * 1024;
    } else if (suffix == "T" || suffix == "TB") {
        multiplier = 1024ULL * 1024 * 1024 * 1024;
    } else {
        throw ConfigError("Invalid size suffix: " + suffix + " (use K, M, G, T, KB, MB, GB, or TB)");
    }

    return static_cast<size_t>(value * multiplier);
}

std::string Config::get_home_directory() {
    const char* home = getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home);
    }

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return std::string(pw->pw_dir);
    }

    throw ConfigError("Unable to determine home directory");
}

std::string Config::get_default_config_path() {
    std::string config_home;
    const char* xdg_config = getenv("XDG_CONFIG_HOME");
    if (xdg_config && xdg_config[0] != '\0') {
        config_home = xdg_config;
    } else {
        config_home = get_home_directory() + "/.config";
    }
    return config_home + "/nimbridge/config.json";
}

std::string Config::get_config_path() const {
    if (!custom_config_path_.empty()) {
        return custom_config_path_;
    }
    return get_default_config_path();
}

void Config::load() {
    std::string config_path = get_config_path();

    LOG_DEBUG("Loading config from: " + config_path);

    if (!std::filesystem::exists(config_path)) {
        // An explicitly requested file must exist
        if (!custom_config_path_.empty()) {
            throw ConfigError("Config file not found: " + config_path);
        }
        LOG_DEBUG("Config file not found, using defaults: " + config_path);
        return;
    }

    try {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw ConfigError("Failed to open config file: " + config_path);
        }

        file >> json;

        if (json.contains("api_base")) {
            api_base = json["api_base"].get<std::string>();
        }
        if (json.contains("api_key")) {
            api_key = json["api_key"].get<std::string>();
        }
        if (json.contains("key")) {
            api_key = json["key"].get<std::string>();
        }
        if (json.contains("upstream_timeout")) {
            upstream_timeout = json["upstream_timeout"].get<long>();
        }
        if (json.contains("connect_timeout")) {
            connect_timeout = json["connect_timeout"].get<long>();
        }
        if (json.contains("ssl_verify")) {
            ssl_verify = json["ssl_verify"].get<bool>();
        }
        if (json.contains("ca_bundle")) {
            ca_bundle = json["ca_bundle"].get<std::string>();
        }
        if (json.contains("token_budget")) {
            token_budget = json["token_budget"].get<int>();
        }
        if (json.contains("normalize_threshold")) {
            int threshold = json["normalize_threshold"].get<int>();
            if (threshold < 0) {
                throw ConfigError("normalize_threshold cannot be negative");
            }
            normalize_threshold = static_cast<size_t>(threshold);
        }
        if (json.contains("lead_in_patterns")) {
            lead_in_patterns = json["lead_in_patterns"].get<std::vector<std::string>>();
        }
        if (json.contains("show_reasoning")) {
            show_reasoning = json["show_reasoning"].get<bool>();
        }
        if (json.contains("thinking_mode")) {
            thinking_mode = json["thinking_mode"].get<bool>();
        }
        if (json.contains("default_temperature")) {
            default_temperature = json["default_temperature"].get<double>();
        }
        if (json.contains("default_max_tokens")) {
            default_max_tokens = json["default_max_tokens"].get<int>();
        }
        if (json.contains("models")) {
            // Replaces the built-in table entirely
            models = json["models"].get<std::map<std::string, std::string>>();
        }
        if (json.contains("fallback_model")) {
            fallback_model = json["fallback_model"].get<std::string>();
        }
        if (json.contains("host")) {
            host = json["host"].get<std::string>();
        }
        if (json.contains("port")) {
            port = json["port"].get<int>();
        }
        if (json.contains("max_body_size")) {
            if (json["max_body_size"].is_string()) {
                set_max_body_size(json["max_body_size"].get<std::string>());
            } else if (json["max_body_size"].is_number()) {
                max_body_size = json["max_body_size"].get<size_t>();
                max_body_size_str = std::to_string(max_body_size);
            }
        }
        if (json.contains("log_level")) {
            log_level = json["log_level"].get<std::string>();
        }

        LOG_DEBUG("Loaded configuration from: " + config_path);

    } catch (const ConfigError&) {
        throw;
    } catch (const json::exception& e) {
        throw ConfigError("Invalid JSON in config file: " + std::string(e.what()));
    } catch (const std::exception& e) {
        throw ConfigError("Error loading config: " + std::string(e.what()));
    }
}

void Config::apply_environment() {
    const char* base = getenv("NIM_API_BASE");
    if (base && base[0] != '\0') {
        api_base = base;
    }
    const char* key = getenv("NIM_API_KEY");
    if (key && key[0] != '\0') {
        api_key = key;
    }
    const char* port_env = getenv("PORT");
    if (port_env && port_env[0] != '\0') {
        try {
            port = std::stoi(port_env);
        } catch (const std::exception&) {
            throw ConfigError("PORT is not a number: " + std::string(port_env));
        }
    }
}

void Config::validate() const {
    if (api_base.empty()) {
        throw ConfigError("api_base must not be empty");
    }
    if (token_budget <= 0) {
        throw ConfigError("token_budget must be positive");
    }
    if (upstream_timeout < 0 || connect_timeout < 0) {
        throw ConfigError("timeouts cannot be negative");
    }
    if (port <= 0 || port > 65535) {
        throw ConfigError("port must be between 1 and 65535");
    }
    if (default_max_tokens <= 0) {
        throw ConfigError("default_max_tokens must be positive");
    }
    if (fallback_model.empty()) {
        throw ConfigError("fallback_model must not be empty");
    }
    try {
        Logger::parse_level(log_level);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
    try {
        LeadInCatalog catalog(lead_in_patterns);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
    if (api_key.empty()) {
        LOG_WARN("No upstream API key configured (set NIM_API_KEY or api_key)");
    }

    LOG_DEBUG("Configuration validation passed");
}

std::string Config::upstream_model(const std::string& public_model) const {
    auto it = models.find(public_model);
    if (it != models.end()) {
        return it->second;
    }
    return fallback_model;
}

std::vector<std::string> Config::public_models() const {
    std::vector<std::string> ids;
    ids.reserve(models.size());
    for (const auto& [id, upstream] : models) {
        ids.push_back(id);
    }
    return ids;
}

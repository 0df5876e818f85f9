#pragma once

#include <string>
#include <map>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/// @brief Transcoder configuration
/// Loaded once at startup and then treated as an immutable value: the
/// transcoder and the API server receive it by const reference.
class Config {
public:
    Config();

    // Load configuration from the config file (missing file = defaults)
    void load();

    // Override values from NIM_API_BASE, NIM_API_KEY and PORT
    void apply_environment();

    // Validation
    void validate() const;

    // Get user's home directory (tries HOME env var first, then getpwuid)
    static std::string get_home_directory();

    // Get default config path (XDG-compliant)
    static std::string get_default_config_path();

    // Set custom config file path (for command-line override)
    void set_config_path(const std::string& config_path) { custom_config_path_ = config_path; }

    // Set max request body size with parsing ("100M", "512K", "1G", ...)
    void set_max_body_size(const std::string& size_str);

    /// @brief Upstream model for a public model id; unknown ids map to fallback_model
    std::string upstream_model(const std::string& public_model) const;

    /// @brief Public model ids, in map order
    std::vector<std::string> public_models() const;

    // Upstream
    std::string api_base;
    std::string api_key;
    long upstream_timeout;      // seconds, 0 = no limit
    long connect_timeout;       // seconds
    bool ssl_verify;
    std::string ca_bundle;

    // History window
    int token_budget;

    // Lead-in normalizer
    size_t normalize_threshold; // characters collected before the first release
    std::vector<std::string> lead_in_patterns;

    // Provider extensions / policy
    bool show_reasoning;        // expose reasoning_content to clients
    bool thinking_mode;         // ask the upstream for deep reasoning
    double default_temperature;
    int default_max_tokens;

    // Model-name translation
    std::map<std::string, std::string> models;
    std::string fallback_model;

    // Front end
    std::string host;
    int port;
    std::string max_body_size_str;
    size_t max_body_size;
    std::string log_level;

    nlohmann::json json;  // Parsed config JSON

private:
    // Internal helpers
    static size_t parse_size_string(const std::string& size_str);
    std::string get_config_path() const;
    void set_defaults();

    std::string custom_config_path_;
};

#include <gtest/gtest.h>
#include "config.h"
#include "content_normalizer.h"
#include "test_helpers.h"
#include "temp_dir.h"
#include <fstream>
#include <cstdlib>
#include <algorithm>

// Test fixture for Config tests
class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create temp directory for test configs
        temp_dir = std::make_unique<test_helpers::TempDir>("config_test_");
        ASSERT_TRUE(temp_dir->valid());
    }

    void TearDown() override {
        temp_dir.reset();
    }

    std::string write_config(const std::string& name, const std::string& content) {
        std::string path = temp_dir->file_path(name);
        std::ofstream file(path);
        file << content;
        file.close();
        return path;
    }

    std::unique_ptr<test_helpers::TempDir> temp_dir;
};

// =============================================================================
// parse_size_string tests (via set_max_body_size)
// =============================================================================

TEST_F(ConfigTest, ParseSizeStringPlainNumber) {
    Config cfg;
    cfg.set_max_body_size("1024");
    EXPECT_EQ(cfg.max_body_size, 1024u);
}

TEST_F(ConfigTest, ParseSizeStringSuffixes) {
    Config cfg;

    cfg.set_max_body_size("10K");
    EXPECT_EQ(cfg.max_body_size, 10u * 1024);

    cfg.set_max_body_size("500MB");
    EXPECT_EQ(cfg.max_body_size, 500ULL * 1024 * 1024);

    cfg.set_max_body_size("1g");
    EXPECT_EQ(cfg.max_body_size, 1024ULL * 1024 * 1024);
    EXPECT_EQ(cfg.max_body_size_str, "1g");
}

TEST_F(ConfigTest, ParseSizeStringFractional) {
    Config cfg;
    cfg.set_max_body_size("0.5M");
    EXPECT_EQ(cfg.max_body_size, static_cast<size_t>(0.5 * 1024 * 1024));
}

TEST_F(ConfigTest, ParseSizeStringInvalid) {
    Config cfg;
    EXPECT_THROW(cfg.set_max_body_size(""), ConfigError);
    EXPECT_THROW(cfg.set_max_body_size("10X"), ConfigError);
    EXPECT_THROW(cfg.set_max_body_size("GB"), ConfigError);
}

TEST_F(ConfigTest, ParseSizeStringNonAscii) {
    Config cfg;
    EXPECT_THROW(cfg.set_max_body_size("\xC3\xA9M"), ConfigError);
    EXPECT_THROW(cfg.set_max_body_size("10\xC3\xA9"), ConfigError);
    EXPECT_THROW(cfg.set_max_body_size("\xFF"), ConfigError);
}

TEST_F(ConfigTest, ParseSizeStringLoneDot) {
    Config cfg;
    EXPECT_THROW(cfg.set_max_body_size(".M"), ConfigError);
}

// =============================================================================
// get_home_directory tests
// =============================================================================

TEST_F(ConfigTest, GetHomeDirectoryRespectsEnv) {
    test_helpers::ScopedEnv env("HOME", "/tmp/test_home_config");

    std::string home = Config::get_home_directory();
    EXPECT_EQ(home, "/tmp/test_home_config");
}

// =============================================================================
// Config defaults tests
// =============================================================================

TEST_F(ConfigTest, DefaultValues) {
    Config cfg;

    EXPECT_EQ(cfg.api_base, "https://integrate.api.nvidia.com/v1");
    EXPECT_EQ(cfg.token_budget, 8000);
    EXPECT_EQ(cfg.normalize_threshold, 48u);
    EXPECT_FALSE(cfg.show_reasoning);
    EXPECT_TRUE(cfg.thinking_mode);
    EXPECT_DOUBLE_EQ(cfg.default_temperature, 0.8);
    EXPECT_EQ(cfg.default_max_tokens, 16384);
    EXPECT_EQ(cfg.upstream_timeout, 600);
    EXPECT_EQ(cfg.port, 3000);
    EXPECT_EQ(cfg.max_body_size, 100ULL * 1024 * 1024);
    EXPECT_EQ(cfg.lead_in_patterns, LeadInCatalog::default_patterns());
}

// =============================================================================
// Model map tests
// =============================================================================

TEST_F(ConfigTest, UpstreamModelMapped) {
    Config cfg;
    EXPECT_EQ(cfg.upstream_model("gpt-4o"), "deepseek-ai/deepseek-v3.1-terminus");
    EXPECT_EQ(cfg.upstream_model("gpt-3.5-turbo"), "meta/llama-3.3-70b-instruct");
}

TEST_F(ConfigTest, UpstreamModelFallback) {
    Config cfg;
    EXPECT_EQ(cfg.upstream_model("not-a-model"), "meta/llama-3.1-70b-instruct");
    EXPECT_EQ(cfg.upstream_model(""), "meta/llama-3.1-70b-instruct");
}

TEST_F(ConfigTest, PublicModelsListsMapKeys) {
    Config cfg;
    auto ids = cfg.public_models();
    EXPECT_EQ(ids.size(), cfg.models.size());
    EXPECT_NE(std::find(ids.begin(), ids.end(), "gpt-4"), ids.end());
}

// =============================================================================
// Validation tests
// =============================================================================

TEST_F(ConfigTest, ValidateDefaultConfig) {
    Config cfg;
    cfg.api_key = "test-key";
    EXPECT_NO_THROW(cfg.validate());
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
    Config cfg;
    cfg.api_key = "test-key";

    cfg.token_budget = 0;
    EXPECT_THROW(cfg.validate(), ConfigError);
    cfg.token_budget = 8000;

    cfg.port = 70000;
    EXPECT_THROW(cfg.validate(), ConfigError);
    cfg.port = 3000;

    cfg.api_base = "";
    EXPECT_THROW(cfg.validate(), ConfigError);
    cfg.api_base = "http://localhost:8000/v1";

    cfg.log_level = "chatty";
    EXPECT_THROW(cfg.validate(), ConfigError);
    cfg.log_level = "debug";

    cfg.lead_in_patterns = {"^(broken"};
    EXPECT_THROW(cfg.validate(), ConfigError);
    cfg.lead_in_patterns = {};

    EXPECT_NO_THROW(cfg.validate());
}

// =============================================================================
// load() tests
// =============================================================================

TEST_F(ConfigTest, LoadMissingDefaultConfigUsesDefaults) {
    test_helpers::ScopedEnv xdg("XDG_CONFIG_HOME", temp_dir->path());

    Config cfg;
    EXPECT_NO_THROW(cfg.load());
    EXPECT_EQ(cfg.token_budget, 8000);
}

TEST_F(ConfigTest, LoadMissingExplicitConfigThrows) {
    Config cfg;
    cfg.set_config_path(temp_dir->file_path("nope.json"));
    EXPECT_THROW(cfg.load(), ConfigError);
}

TEST_F(ConfigTest, LoadOverridesDefaults) {
    std::string path = write_config("config.json", R"({
        "api_base": "http://localhost:9000/v1",
        "api_key": "from-file",
        "token_budget": 1234,
        "normalize_threshold": 16,
        "show_reasoning": true,
        "thinking_mode": false,
        "default_temperature": 0.2,
        "models": {"my-model": "vendor/model-x"},
        "fallback_model": "vendor/model-y",
        "port": 8080,
        "max_body_size": "10M",
        "log_level": "debug"
    })");

    Config cfg;
    cfg.set_config_path(path);
    cfg.load();

    EXPECT_EQ(cfg.api_base, "http://localhost:9000/v1");
    EXPECT_EQ(cfg.api_key, "from-file");
    EXPECT_EQ(cfg.token_budget, 1234);
    EXPECT_EQ(cfg.normalize_threshold, 16u);
    EXPECT_TRUE(cfg.show_reasoning);
    EXPECT_FALSE(cfg.thinking_mode);
    EXPECT_DOUBLE_EQ(cfg.default_temperature, 0.2);
    EXPECT_EQ(cfg.port, 8080);
    EXPECT_EQ(cfg.max_body_size, 10ULL * 1024 * 1024);
    EXPECT_EQ(cfg.log_level, "debug");

    // The models table replaces the built-in one
    EXPECT_EQ(cfg.models.size(), 1u);
    EXPECT_EQ(cfg.upstream_model("my-model"), "vendor/model-x");
    EXPECT_EQ(cfg.upstream_model("gpt-4"), "vendor/model-y");
}

TEST_F(ConfigTest, LoadInvalidJson) {
    std::string path = write_config("invalid.json", "{ invalid json }");

    Config cfg;
    cfg.set_config_path(path);
    EXPECT_THROW(cfg.load(), ConfigError);
}

TEST_F(ConfigTest, LoadWrongType) {
    std::string path = write_config("typed.json", R"({"token_budget": "lots"})");

    Config cfg;
    cfg.set_config_path(path);
    EXPECT_THROW(cfg.load(), ConfigError);
}

TEST_F(ConfigTest, LoadNegativeThreshold) {
    std::string path = write_config("threshold.json", R"({"normalize_threshold": -1})");

    Config cfg;
    cfg.set_config_path(path);
    EXPECT_THROW(cfg.load(), ConfigError);
}

// =============================================================================
// Environment override tests
// =============================================================================

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    std::string path = write_config("config.json", R"({"api_key": "from-file", "port": 8080})");
    test_helpers::ScopedEnv key("NIM_API_KEY", "from-env");
    test_helpers::ScopedEnv base("NIM_API_BASE", "http://env-host/v1");
    test_helpers::ScopedEnv port("PORT", "4000");

    Config cfg;
    cfg.set_config_path(path);
    cfg.load();
    cfg.apply_environment();

    EXPECT_EQ(cfg.api_key, "from-env");
    EXPECT_EQ(cfg.api_base, "http://env-host/v1");
    EXPECT_EQ(cfg.port, 4000);
}

TEST_F(ConfigTest, EmptyEnvironmentIgnored) {
    test_helpers::ScopedEnv key("NIM_API_KEY", "");
    test_helpers::ScopedEnv base("NIM_API_BASE", "");
    test_helpers::ScopedEnv port("PORT", "");

    Config cfg;
    cfg.api_key = "kept";
    cfg.apply_environment();

    EXPECT_EQ(cfg.api_key, "kept");
    EXPECT_EQ(cfg.api_base, "https://integrate.api.nvidia.com/v1");
    EXPECT_EQ(cfg.port, 3000);
}

TEST_F(ConfigTest, NonNumericPortFromEnvironment) {
    test_helpers::ScopedEnv port("PORT", "http");

    Config cfg;
    EXPECT_THROW(cfg.apply_environment(), ConfigError);
}

// =============================================================================
// XDG paths tests
// =============================================================================

TEST_F(ConfigTest, GetDefaultConfigPathXdg) {
    test_helpers::ScopedEnv home("HOME", "/home/testuser");
    test_helpers::ScopedEnv xdg("XDG_CONFIG_HOME", "/custom/config");

    std::string path = Config::get_default_config_path();
    EXPECT_EQ(path, "/custom/config/nimbridge/config.json");
}

TEST_F(ConfigTest, GetDefaultConfigPathNoXdg) {
    test_helpers::ScopedEnv home("HOME", "/home/testuser");
    unsetenv("XDG_CONFIG_HOME");

    std::string path = Config::get_default_config_path();
    EXPECT_EQ(path, "/home/testuser/.config/nimbridge/config.json");
}

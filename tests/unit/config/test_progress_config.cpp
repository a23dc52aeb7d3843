/**
 * @file test_progress_config.cpp
 * @brief Unit tests for YAML loading, environment overrides and validation
 */

#include <gtest/gtest.h>
#include "core/config/progress_config.h"

#include <cstdlib>
#include <stdexcept>

using namespace uploadwatch::config;
using namespace std::chrono_literals;

namespace {

class EnvGuard {
public:
    EnvGuard(const char* key, const char* value) : key_(key) { ::setenv(key, value, 1); }
    ~EnvGuard() { ::unsetenv(key_); }

private:
    const char* key_;
};

} // namespace

TEST(ProgressConfig, DefaultsMatchProtocolTunables) {
    ProgressClientConfig cfg;
    EXPECT_EQ(cfg.connect_timeout, 60000ms);
    EXPECT_EQ(cfg.heartbeat_interval, 30000ms);
    EXPECT_EQ(cfg.completion_fallback, 30000ms);
    EXPECT_EQ(cfg.backoff_base, 1000ms);
    EXPECT_EQ(cfg.backoff_cap, 30000ms);
    EXPECT_EQ(cfg.max_reconnect_attempts, 5);
    EXPECT_EQ(cfg.completion_close_grace, 1000ms);
    EXPECT_EQ(cfg.progress_path, "/api/ws/progress/");
}

TEST(ProgressConfig, LoadsYamlAndKeepsDefaultsForMissingKeys) {
    auto cfg = ConfigLoader::load_from_string(R"(
endpoints:
  api_url: https://api.example.com
progress:
  heartbeat_interval_ms: 15000
  max_reconnect_attempts: 3
)");
    EXPECT_EQ(cfg.api_url, "https://api.example.com");
    EXPECT_TRUE(cfg.ws_base_url.empty());
    EXPECT_EQ(cfg.heartbeat_interval, 15000ms);
    EXPECT_EQ(cfg.max_reconnect_attempts, 3);
    EXPECT_EQ(cfg.completion_fallback, 30000ms);
}

TEST(ProgressConfig, MalformedYamlThrows) {
    EXPECT_THROW(ConfigLoader::load_from_string("progress: [unterminated"), std::runtime_error);
    EXPECT_THROW(ConfigLoader::load_from_string("progress:\n  backoff_base_ms: soon\n"), std::runtime_error);
}

TEST(ProgressConfig, MissingFileThrows) {
    EXPECT_THROW(ConfigLoader::load_from_yaml("/nonexistent/uploadwatch.yaml"), std::runtime_error);
}

TEST(ProgressConfig, EnvironmentOverridesFileValues) {
    EnvGuard api("UPLOADWATCH_API_URL", "http://10.0.0.5:9000");
    EnvGuard grace("UPLOADWATCH_COMPLETION_CLOSE_GRACE_MS", "250");
    EnvGuard attempts("UPLOADWATCH_MAX_RECONNECT_ATTEMPTS", "7");
    EnvGuard bad("UPLOADWATCH_BACKOFF_BASE_MS", "fast");

    ProgressClientConfig cfg;
    ConfigLoader::apply_env_overrides(cfg);
    EXPECT_EQ(cfg.api_url, "http://10.0.0.5:9000");
    EXPECT_EQ(cfg.completion_close_grace, 250ms);
    EXPECT_EQ(cfg.max_reconnect_attempts, 7);
    EXPECT_EQ(cfg.backoff_base, 1000ms);
}

TEST(ProgressConfig, ValidationReportsEveryProblem) {
    ProgressClientConfig cfg;
    cfg.api_url = "ftp://example.com";
    cfg.ws_base_url = "http://example.com";
    cfg.heartbeat_interval = 0ms;
    cfg.backoff_cap = 10ms;

    std::vector<std::string> errors;
    EXPECT_FALSE(validate_config(cfg, errors));
    EXPECT_EQ(errors.size(), 4u);

    EXPECT_TRUE(validate_config(ProgressClientConfig{}, errors));
    EXPECT_TRUE(errors.empty());
}

TEST(ProgressConfig, EffectiveWsBaseUrl) {
    ProgressClientConfig cfg;
    cfg.api_url = "https://api.example.com/";
    EXPECT_EQ(effective_ws_base_url(cfg), "wss://api.example.com");

    cfg.ws_base_url = "ws://stream.example.com:8001/";
    EXPECT_EQ(effective_ws_base_url(cfg), "ws://stream.example.com:8001");

    cfg.ws_base_url.clear();
    cfg.api_url = "localhost:8000";
    EXPECT_EQ(effective_ws_base_url(cfg), "");
}

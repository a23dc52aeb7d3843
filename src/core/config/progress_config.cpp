/**
 * @file progress_config.cpp
 */

#include "core/config/progress_config.h"
#include "utils/string_utils.h"

#include <cstdlib>
#include <initializer_list>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace uploadwatch::config {

namespace {

void read_ms(const YAML::Node& node, const char* key, std::chrono::milliseconds& out) {
    if (node[key]) {
        out = std::chrono::milliseconds(node[key].as<long long>());
    }
}

ProgressClientConfig from_node(const YAML::Node& root) {
    ProgressClientConfig cfg;

    if (root["endpoints"]) {
        auto ep = root["endpoints"];
        if (ep["api_url"]) cfg.api_url = ep["api_url"].as<std::string>();
        if (ep["ws_base_url"]) cfg.ws_base_url = ep["ws_base_url"].as<std::string>();
        if (ep["progress_path"]) cfg.progress_path = ep["progress_path"].as<std::string>();
        if (ep["upload_path"]) cfg.upload_path = ep["upload_path"].as<std::string>();
        if (ep["cancel_path"]) cfg.cancel_path = ep["cancel_path"].as<std::string>();
    }

    if (root["progress"]) {
        auto p = root["progress"];
        read_ms(p, "connect_timeout_ms", cfg.connect_timeout);
        read_ms(p, "heartbeat_interval_ms", cfg.heartbeat_interval);
        read_ms(p, "completion_fallback_ms", cfg.completion_fallback);
        read_ms(p, "backoff_base_ms", cfg.backoff_base);
        read_ms(p, "backoff_cap_ms", cfg.backoff_cap);
        read_ms(p, "completion_close_grace_ms", cfg.completion_close_grace);
        read_ms(p, "cancel_timeout_ms", cfg.cancel_timeout);
        if (p["max_reconnect_attempts"]) {
            cfg.max_reconnect_attempts = p["max_reconnect_attempts"].as<int>();
        }
    }
    return cfg;
}

bool env_ms(const char* key, std::chrono::milliseconds& out) {
    const char* v = std::getenv(key);
    if (!v) return false;
    char* endp = nullptr;
    long long ms = std::strtoll(v, &endp, 10);
    if (!endp || *endp != '\0' || endp == v) {
        spdlog::warn("[ConfigLoader] ignoring {}='{}': not an integer", key, v);
        return false;
    }
    out = std::chrono::milliseconds(ms);
    return true;
}

bool has_scheme(const std::string& url, std::initializer_list<const char*> schemes) {
    const std::string lower = utils::to_lower_ascii(url);
    for (const char* s : schemes) {
        if (lower.rfind(s, 0) == 0) return true;
    }
    return false;
}

} // namespace

ProgressClientConfig ConfigLoader::load_from_yaml(const std::string& path) {
    spdlog::info("[ConfigLoader] Loading configuration from: {}", path);
    try {
        auto cfg = from_node(YAML::LoadFile(path));
        spdlog::info("[ConfigLoader] Configuration loaded: api_url={}", cfg.api_url);
        return cfg;
    } catch (const YAML::Exception& e) {
        spdlog::error("[ConfigLoader] YAML error: {}", e.what());
        throw std::runtime_error("Failed to load config: " + std::string(e.what()));
    }
}

ProgressClientConfig ConfigLoader::load_from_string(const std::string& yaml_text) {
    try {
        return from_node(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        spdlog::error("[ConfigLoader] YAML error: {}", e.what());
        throw std::runtime_error("Failed to load config: " + std::string(e.what()));
    }
}

void ConfigLoader::apply_env_overrides(ProgressClientConfig& config) {
    if (const char* v = std::getenv("UPLOADWATCH_API_URL")) config.api_url = v;
    if (const char* v = std::getenv("UPLOADWATCH_WS_URL")) config.ws_base_url = v;

    env_ms("UPLOADWATCH_CONNECT_TIMEOUT_MS", config.connect_timeout);
    env_ms("UPLOADWATCH_HEARTBEAT_INTERVAL_MS", config.heartbeat_interval);
    env_ms("UPLOADWATCH_COMPLETION_FALLBACK_MS", config.completion_fallback);
    env_ms("UPLOADWATCH_BACKOFF_BASE_MS", config.backoff_base);
    env_ms("UPLOADWATCH_BACKOFF_CAP_MS", config.backoff_cap);
    env_ms("UPLOADWATCH_COMPLETION_CLOSE_GRACE_MS", config.completion_close_grace);
    env_ms("UPLOADWATCH_CANCEL_TIMEOUT_MS", config.cancel_timeout);

    if (const char* v = std::getenv("UPLOADWATCH_MAX_RECONNECT_ATTEMPTS")) {
        char* endp = nullptr;
        long n = std::strtol(v, &endp, 10);
        if (endp && *endp == '\0' && endp != v) {
            config.max_reconnect_attempts = static_cast<int>(n);
        } else {
            spdlog::warn("[ConfigLoader] ignoring UPLOADWATCH_MAX_RECONNECT_ATTEMPTS='{}'", v);
        }
    }
}

bool validate_config(const ProgressClientConfig& config, std::vector<std::string>& errors) {
    errors.clear();

    if (!has_scheme(config.api_url, {"http://", "https://"})) {
        errors.push_back("api_url must start with http:// or https:// (got '" + config.api_url + "')");
    }
    if (!config.ws_base_url.empty() && !has_scheme(config.ws_base_url, {"ws://", "wss://"})) {
        errors.push_back("ws_base_url must start with ws:// or wss:// (got '" + config.ws_base_url + "')");
    }

    const std::pair<const char*, std::chrono::milliseconds> durations[] = {
        {"connect_timeout", config.connect_timeout},
        {"heartbeat_interval", config.heartbeat_interval},
        {"completion_fallback", config.completion_fallback},
        {"backoff_base", config.backoff_base},
        {"backoff_cap", config.backoff_cap},
        {"completion_close_grace", config.completion_close_grace},
        {"cancel_timeout", config.cancel_timeout},
    };
    for (const auto& [name, value] : durations) {
        if (value.count() <= 0) {
            errors.push_back(std::string(name) + " must be positive");
        }
    }
    if (config.backoff_cap < config.backoff_base) {
        errors.push_back("backoff_cap must not be smaller than backoff_base");
    }
    if (config.max_reconnect_attempts < 0) {
        errors.push_back("max_reconnect_attempts must not be negative");
    }
    return errors.empty();
}

std::string effective_ws_base_url(const ProgressClientConfig& config) {
    if (!config.ws_base_url.empty()) return utils::trim_trailing_slash(config.ws_base_url);
    return utils::derive_ws_base_url(config.api_url).value_or(std::string{});
}

} // namespace uploadwatch::config

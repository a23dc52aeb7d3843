/**
 * @file progress_config.h
 * @brief Endpoints and tunables for the upload progress client.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace uploadwatch::config {

struct ProgressClientConfig {
    // Endpoints
    std::string api_url{"http://localhost:8000"};
    std::string ws_base_url;                          // empty: derived from api_url
    std::string progress_path{"/api/ws/progress/"};
    std::string upload_path{"/api/extract-tables-smart/"};
    std::string cancel_path{"/api/cancel-extraction/"};

    // Stream tunables
    std::chrono::milliseconds connect_timeout{60000};
    std::chrono::milliseconds heartbeat_interval{30000};
    std::chrono::milliseconds completion_fallback{30000};
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds backoff_cap{30000};
    int max_reconnect_attempts{5};
    std::chrono::milliseconds completion_close_grace{1000};

    // Upper bound for the best-effort server cancel request.
    std::chrono::milliseconds cancel_timeout{10000};
};

/**
 * @class ConfigLoader
 * @brief Loads ProgressClientConfig from YAML and the environment.
 *
 * YAML layout:
 * @code
 * endpoints:
 *   api_url: https://api.example.com
 *   ws_base_url: wss://api.example.com   # optional
 * progress:
 *   connect_timeout_ms: 60000
 *   heartbeat_interval_ms: 30000
 *   ...
 * @endcode
 */
class ConfigLoader {
public:
    // Keys absent from the file keep their defaults. Throws std::runtime_error
    // when the file cannot be read or parsed.
    static ProgressClientConfig load_from_yaml(const std::string& path);

    // Same rules as load_from_yaml, applied to in-memory text.
    static ProgressClientConfig load_from_string(const std::string& yaml_text);

    // UPLOADWATCH_API_URL, UPLOADWATCH_WS_URL and UPLOADWATCH_<TUNABLE>_MS.
    // Unparsable values are logged and ignored.
    static void apply_env_overrides(ProgressClientConfig& config);
};

// Returns false and fills `errors` when the config cannot be used.
bool validate_config(const ProgressClientConfig& config, std::vector<std::string>& errors);

// ws_base_url when set, otherwise derived from api_url (http->ws, https->wss).
// Empty when neither is usable.
std::string effective_ws_base_url(const ProgressClientConfig& config);

} // namespace uploadwatch::config

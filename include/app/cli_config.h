#pragma once

#include "core/config/progress_config.h"
#include <map>
#include <optional>
#include <string>

namespace uploadwatch {
namespace cli {

struct CliOptions {
    std::string config_path;
    std::string file_path;
    std::string token;
    std::string api_url;
    std::string ws_url;
    std::string extraction_method{"smart"};
    bool use_enhanced{true};
    std::optional<std::string> statement_date;
    std::map<std::string, std::string> extra_fields;
    std::string log_level{"info"};
};

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument vector
 * @return Parsed options (exits on --help or parse errors)
 */
CliOptions parse_command_line_args(int argc, char* argv[]);

/**
 * @brief Build the effective client configuration
 *
 * Defaults, then the YAML file (if given), then UPLOADWATCH_* environment
 * variables, then CLI flags.
 */
config::ProgressClientConfig build_client_config(const CliOptions& options);

/**
 * @brief Validate options and configuration
 * @return true if valid, false otherwise (errors printed to stderr)
 */
bool validate_config(const CliOptions& options, const config::ProgressClientConfig& config);

/**
 * @brief Initialize logging system (console sink on stderr; stdout carries results)
 * @param level spdlog level name ("debug", "info", ...)
 * @return true if successful, false otherwise
 */
bool initialize_logging(const std::string& level);

} // namespace cli
} // namespace uploadwatch

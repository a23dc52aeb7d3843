#include "app/cli_config.h"
#include <args.hxx>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <filesystem>
#include <vector>

namespace uploadwatch {
namespace cli {

CliOptions parse_command_line_args(int argc, char* argv[]) {
    args::ArgumentParser parser("uploadwatch",
                                "Upload a commission statement and follow its extraction progress.");

    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});
    args::ValueFlag<std::string> file(parser, "path", "Statement file to upload [REQUIRED]", {'f', "file"});
    args::ValueFlag<std::string> config_path(parser, "path", "YAML configuration file", {'c', "config"});
    args::ValueFlag<std::string> token(parser, "token", "Bearer token (else UPLOADWATCH_ACCESS_TOKEN)", {"token"});
    args::ValueFlag<std::string> api_url(parser, "url", "API base URL, e.g. https://api.example.com", {"api-url"});
    args::ValueFlag<std::string> ws_url(parser, "url", "Progress stream base URL (default: derived from --api-url)", {"ws-url"});
    args::ValueFlag<std::string> method(parser, "method", "Extraction method (default: smart)", {"method"});
    args::Flag no_enhanced(parser, "no-enhanced", "Disable the enhanced extraction pipeline", {"no-enhanced"});
    args::ValueFlag<std::string> statement_date(parser, "date", "Statement date passed to the job", {"statement-date"});
    args::ValueFlagList<std::string> fields(parser, "key=value", "Extra form field (repeatable)", {"field"});
    args::ValueFlag<std::string> log_level(parser, "level", "trace|debug|info|warn|error (default: info)", {"log-level"});

    CliOptions options;

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Completion& e) {
        std::cout << e.what();
        std::exit(0);
    } catch (const args::Help&) {
        std::cout << parser;
        std::cout << "\nExamples:\n";
        std::cout << "  " << argv[0] << " --file statement.pdf --api-url https://api.example.com --token $TOKEN\n";
        std::cout << "  " << argv[0] << " --config config/uploadwatch.example.yaml --file statement.pdf --statement-date 2025-01-31\n\n";
        std::exit(0);
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        std::exit(1);
    }

    if (file) options.file_path = args::get(file);
    if (config_path) options.config_path = args::get(config_path);
    if (token) options.token = args::get(token);
    if (api_url) options.api_url = args::get(api_url);
    if (ws_url) options.ws_url = args::get(ws_url);
    if (method) options.extraction_method = args::get(method);
    if (statement_date) options.statement_date = args::get(statement_date);
    if (log_level) options.log_level = args::get(log_level);
    options.use_enhanced = !no_enhanced;

    for (const auto& kv : args::get(fields)) {
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "Error: --field expects key=value, got '" << kv << "'\n";
            std::exit(1);
        }
        options.extra_fields[kv.substr(0, eq)] = kv.substr(eq + 1);
    }

    return options;
}

config::ProgressClientConfig build_client_config(const CliOptions& options) {
    config::ProgressClientConfig cfg;
    if (!options.config_path.empty()) {
        cfg = config::ConfigLoader::load_from_yaml(options.config_path);
    }
    config::ConfigLoader::apply_env_overrides(cfg);
    if (!options.api_url.empty()) cfg.api_url = options.api_url;
    if (!options.ws_url.empty()) cfg.ws_base_url = options.ws_url;
    return cfg;
}

bool validate_config(const CliOptions& options, const config::ProgressClientConfig& config) {
    std::vector<std::string> errors;

    if (options.file_path.empty()) {
        errors.push_back("--file is required");
    } else {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(options.file_path, ec)) {
            errors.push_back("File not found: " + options.file_path);
        }
    }
    if (spdlog::level::from_str(options.log_level) == spdlog::level::off && options.log_level != "off") {
        errors.push_back("Unknown log level '" + options.log_level + "'");
    }

    std::vector<std::string> config_errors;
    if (!config::validate_config(config, config_errors)) {
        errors.insert(errors.end(), config_errors.begin(), config_errors.end());
    }

    if (!errors.empty()) {
        std::cerr << "Configuration errors:\n";
        for (const auto& error : errors) {
            std::cerr << "  - " << error << "\n";
        }
        return false;
    }

    return true;
}

bool initialize_logging(const std::string& level) {
    // Create logs directory if it doesn't exist
    try {
        std::filesystem::create_directories("logs");
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "Failed to create logs directory: " << ex.what() << std::endl;
        return false;
    }

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::debug);

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            "logs/uploadwatch.log", 1024*1024*5, 3);
        file_sink->set_level(spdlog::level::trace);

        std::vector<spdlog::sink_ptr> sinks {console_sink, file_sink};
        auto logger = std::make_shared<spdlog::logger>("multi_sink", sinks.begin(), sinks.end());

        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [PID:%P] [TID:%t] [%^%l%$] [%s:%#] [%!] %v");
        logger->set_level(spdlog::level::from_str(level));

        spdlog::set_default_logger(logger);
        spdlog::flush_every(std::chrono::seconds(1));

        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

} // namespace cli
} // namespace uploadwatch

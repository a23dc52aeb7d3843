/**
 * @file main.cpp
 * @brief uploadwatch_cli: upload one statement and follow its extraction.
 *
 * Exit codes: 0 success, 1 usage/config error, 2 extraction failed,
 * 3 duplicate upload, 130 cancelled (SIGINT/SIGTERM).
 */

#include "app/cli_config.h"
#include "core/auth/credentials_resolver.h"
#include "core/net/beast_ws_client.h"
#include "session/upload_session.h"
#include "upload/http_upload_api.h"

#include <csignal>
#include <iostream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

namespace {

int exit_code_for(uploadwatch::upload::UploadOutcomeKind kind) {
    using uploadwatch::upload::UploadOutcomeKind;
    switch (kind) {
        case UploadOutcomeKind::Success: return 0;
        case UploadOutcomeKind::Failure: return 2;
        case UploadOutcomeKind::Conflict: return 3;
        case UploadOutcomeKind::Cancelled: return 130;
        default: return 2;
    }
}

void report_outcome(const uploadwatch::upload::UploadOutcome& outcome) {
    using uploadwatch::upload::UploadOutcomeKind;
    switch (outcome.kind) {
        case UploadOutcomeKind::Success: {
            std::size_t tables = 0;
            if (auto it = outcome.payload.find("tables"); it != outcome.payload.end() && it->is_array()) {
                tables = it->size();
            }
            spdlog::info("[Main] extraction succeeded ({} tables, via {})", tables, to_string(outcome.source));
            if (auto it = outcome.payload.find("conversational_summary");
                it != outcome.payload.end() && it->is_string()) {
                spdlog::info("[Main] summary: {}", it->get<std::string>());
            }
            std::cout << outcome.payload.dump(2) << std::endl;
            break;
        }
        case UploadOutcomeKind::Conflict:
            spdlog::warn("[Main] {}: duplicate of upload {} ('{}', uploaded {})",
                         to_string(outcome.error_kind.value_or(uploadwatch::ErrorKind::ConflictError)),
                         outcome.duplicate->existing_upload_id,
                         outcome.duplicate->existing_file_name,
                         outcome.duplicate->existing_upload_date_formatted.empty()
                             ? outcome.duplicate->existing_upload_date
                             : outcome.duplicate->existing_upload_date_formatted);
            break;
        case UploadOutcomeKind::Cancelled:
            spdlog::warn("[Main] upload cancelled");
            break;
        default:
            spdlog::error("[Main] extraction failed: {}", outcome.error);
            break;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace uploadwatch;

    cli::CliOptions options;
    config::ProgressClientConfig cfg;
    try {
        options = cli::parse_command_line_args(argc, argv);
        cfg = cli::build_client_config(options);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (!cli::validate_config(options, cfg)) {
        std::cerr << "Use --help for usage information." << std::endl;
        return 1;
    }

    if (!cli::initialize_logging(options.log_level)) {
        return 1;
    }

    spdlog::info("=== uploadwatch ===");
    spdlog::info("[Main] api_url={} ws_base={}", cfg.api_url, config::effective_ws_base_url(cfg));

    const std::string token = auth::resolve_bearer_token(options.token);

    int exit_code = 2;
    try {
        boost::asio::io_context ioc;
        auto api = std::make_shared<upload::HttpUploadApi>(ioc, cfg);
        auto session = std::make_shared<session::UploadSession>(
            ioc, cfg, api,
            [&ioc]() { return std::make_unique<netws::BeastWsClient>(ioc); },
            token);

        session::SessionCallbacks callbacks;
        callbacks.on_progress = [](const progress::ProgressState& state) {
            spdlog::info("[Main] stage {} ({}) {:.0f}% {}", state.stage, state.stage_name,
                         state.percentage, state.message);
            if (state.estimated_remaining) {
                spdlog::debug("[Main] eta {}", *state.estimated_remaining);
            }
        };
        callbacks.on_metadata = [](const nlohmann::json& details) {
            spdlog::info("[Main] metadata: {}", details.dump());
        };
        callbacks.on_connection_error = [](const SessionError& error) {
            spdlog::warn("[Main] progress stream unavailable ({}{}): {}", to_string(error.kind),
                         error.cause ? ", cause " + to_string(*error.cause) : std::string{}, error.message);
        };
        callbacks.on_outcome = [&ioc, &exit_code](const upload::UploadOutcome& outcome) {
            report_outcome(outcome);
            exit_code = exit_code_for(outcome.kind);
            // Let the stream teardown get going before the loop stops.
            boost::asio::post(ioc, [&ioc]() { ioc.stop(); });
        };
        session->set_callbacks(std::move(callbacks));

        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        std::weak_ptr<session::UploadSession> weak_session = session;
        signals.async_wait([weak_session](const boost::system::error_code& ec, int signo) {
            if (ec) return;
            spdlog::info("[Main] received signal {}, cancelling...", signo);
            if (auto s = weak_session.lock()) s->cancel();
        });

        upload::UploadRequest request;
        request.file_path = options.file_path;
        request.extraction_method = options.extraction_method;
        request.use_enhanced = options.use_enhanced;
        request.statement_date = options.statement_date;
        request.extra_fields = options.extra_fields;

        session->start(std::move(request));
        ioc.run();
    } catch (const std::exception& e) {
        spdlog::error("[Main] fatal: {}", e.what());
        return 1;
    }

    spdlog::info("[Main] done (exit code {})", exit_code);
    return exit_code;
}

/**
 * @file main.cpp
 * @brief CodeLab sandbox daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Wires all modules into a complete execution pipeline:
 *   Config → Logger → Orchestrator (Validator → Translator → Executor → Sessions) → Gateway
 *
 * One-shot modes (--run, --translate) reuse the same pipeline without
 * opening a socket.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "gateway/http_server.hpp"
#include "gateway/request_gateway.hpp"
#include "orchestrator/execution_orchestrator.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

using namespace codelab;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cerr << R"(
  ╔═══════════════════════════════════════════╗
  ║           CodeLab Sandbox v1.0.0          ║
  ║   Teaching-Dialect Translator and         ║
  ║   Multi-Language Code Executor            ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    uint16_t port = 0;
    std::string log_dir;
    std::filesystem::path run_file;
    std::string language = "python";
    std::filesystem::path translate_file;
    std::string direction = "teaching_to_host";
};

void print_usage() {
    std::cout << "Usage: codelab_sandboxd [OPTIONS]\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --port <port>        HTTP listen port (0 = ephemeral)\n"
              << "  --log-dir <path>     Log output directory\n"
              << "  --run <file>         Execute a source file once, then exit\n"
              << "  --language <id>      Language for --run (default: python)\n"
              << "  --translate <file>   Translate a source file once, then exit\n"
              << "  --direction <dir>    teaching_to_host | host_to_teaching\n"
              << "  --help, -h           Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            args.port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--run" && i + 1 < argc) {
            args.run_file = argv[++i];
        } else if (arg == "--language" && i + 1 < argc) {
            args.language = argv[++i];
        } else if (arg == "--translate" && i + 1 < argc) {
            args.translate_file = argv[++i];
        } else if (arg == "--direction" && i + 1 < argc) {
            args.direction = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

Result<std::string> read_source(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::Io, "Cannot read " + path.string()};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::unique_ptr<ILogSink> make_log_sink(const TelemetryConfig& telemetry) {
    if (telemetry.log_dir.empty()) return std::make_unique<StdoutSink>();
    return std::make_unique<JsonFileSink>(telemetry.log_dir, "codelab_sandboxd",
                                          telemetry.max_file_size_mb, telemetry.rotate_count);
}

std::unique_ptr<ILogSink> make_metrics_sink(const TelemetryConfig& telemetry) {
    if (telemetry.metrics_file.empty()) return std::make_unique<NullSink>();
    auto dir = telemetry.metrics_file.parent_path();
    return std::make_unique<JsonFileSink>(dir.empty() ? std::filesystem::path(".") : dir,
                                          telemetry.metrics_file.stem().string(),
                                          telemetry.max_file_size_mb, telemetry.rotate_count);
}

/**
 * @brief --run: execute one file, mirror its streams, exit with its code.
 */
int run_once(ExecutionOrchestrator<>& orchestrator, const CLIArgs& args) {
    auto source = read_source(args.run_file);
    if (!source) {
        std::cerr << source.error().message << std::endl;
        return 2;
    }

    ExecutionRequest request;
    request.code = std::move(*source);
    request.language = args.language;
    request.user_id = "cli";

    auto result = orchestrator.submit(request);
    std::cout << result.stdout_data << std::flush;
    if (result.stderr_data) std::cerr << *result.stderr_data << std::endl;
    std::cerr << "[" << to_string(result.status) << "] exit " << result.exit_code << ", "
              << result.execution_time_seconds << "s, "
              << result.memory_used_bytes / 1024 << " KB" << std::endl;
    return result.succeeded() ? 0 : (result.exit_code != 0 ? result.exit_code : 1);
}

/**
 * @brief --translate: print the translated code, diagnostics on stderr.
 */
int translate_once(ExecutionOrchestrator<>& orchestrator, const CLIArgs& args) {
    auto direction = parse_direction(args.direction);
    if (!direction) {
        std::cerr << "Unknown translation direction: " << args.direction << std::endl;
        return 2;
    }
    auto source = read_source(args.translate_file);
    if (!source) {
        std::cerr << source.error().message << std::endl;
        return 2;
    }

    auto result = orchestrator.translate(*source, *direction);
    std::cout << result.translated_code << std::flush;
    for (const auto& warning : result.warnings) std::cerr << "warning: " << warning << "\n";
    for (const auto& error : result.errors) std::cerr << "error: " << error << "\n";
    return result.success ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    if (auto env = apply_env_overrides(config); !env) {
        std::cerr << "Environment override ignored: " << env.error().message << std::endl;
    }

    // Apply CLI overrides
    if (args.port != 0) config.server.port = args.port;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);

    // ── Initialize Pipeline ──────────────────
    ExecutionOrchestrator<>::Options options;
    options.log_sink = make_log_sink(config.telemetry);
    options.metrics_sink = make_metrics_sink(config.telemetry);
    options.log_level = level;
    options.config = config;
    ExecutionOrchestrator<> orchestrator(std::move(options));
    auto& logger = orchestrator.logger();

    std::string languages;
    for (auto language : orchestrator.supported_languages()) {
        if (!languages.empty()) languages += ", ";
        languages += to_string(language);
    }
    logger.info("Languages: " + languages);

    // ── One-shot modes ───────────────────────
    if (!args.run_file.empty()) return run_once(orchestrator, args);
    if (!args.translate_file.empty()) return translate_once(orchestrator, args);

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Initialize Gateway ───────────────────
    RequestGateway<ExecutionOrchestrator<>> gateway(orchestrator, logger);

    HttpServer::Options server_options;
    server_options.host = config.server.host;
    server_options.port = config.server.port;
    server_options.worker_threads = config.server.worker_threads;
    server_options.max_pending = config.server.max_pending_requests;
    server_options.max_request_bytes = config.server.max_request_bytes;

    HttpServer server(server_options);
    auto listen_result = server.listen();
    if (!listen_result) {
        logger.error("Could not start HTTP server: " + listen_result.error().message);
        return 1;
    }
    server.serve([&gateway](const HttpRequest& request, std::stop_token stop) {
        return gateway.handle(request, std::move(stop));
    });
    logger.info("HTTP gateway listening on " + config.server.host + ":"
                + std::to_string(server.bound_port()));

    // ── Main Loop ────────────────────────────
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        // Periodic status logging (every 60 seconds at 100ms intervals)
        if (++loop_count % 600 == 0) {
            logger.info("Status: " + std::to_string(server.requests_served()) + " served, "
                        + std::to_string(server.requests_rejected()) + " rejected (busy)");
            logger.flush();
        }
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    server.stop();
    orchestrator.metrics().record_custom("gateway_shutdown",
        R"({"served":)" + std::to_string(server.requests_served())
        + R"(,"rejected":)" + std::to_string(server.requests_rejected()) + "}");
    logger.info("CodeLab sandbox stopped.");
    return 0;
}

/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization and env overrides.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace codelab {

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    uint32_t worker_threads = 0;            ///< 0 = hardware_concurrency
    uint32_t max_pending_requests = 64;
    uint64_t max_request_bytes = 1048576;
    uint32_t max_sessions = 10000;          ///< Least recently active session evicted beyond this
};

struct SandboxConfig {
    uint32_t timeout_s = 30;
    uint32_t compile_timeout_s = 30;
    uint32_t java_compile_timeout_s = 10;
    uint64_t max_memory_mb = 128;
    bool enforce_memory_limit = true;
    uint64_t max_output_bytes = 10240;
    uint64_t max_code_bytes = 102400;
    std::filesystem::path scratch_dir;      ///< Empty = system temp directory

    [[nodiscard]] std::chrono::milliseconds run_timeout() const noexcept {
        return std::chrono::seconds(timeout_s);
    }
};

struct ToolchainConfig {
    std::string python = "python3";
    std::string node = "node";
    std::string javac = "javac";
    std::string java = "java";
    std::string gcc = "gcc";
    std::string gxx = "g++";
    std::string jac;                        ///< Teaching interpreter; empty = translate to host
};

struct SecurityConfig {
    bool enabled = true;
    std::vector<std::string> blocked_imports{
        "os", "sys", "subprocess", "importlib", "socket", "shutil", "ctypes", "multiprocessing"
    };
    std::vector<std::string> blocked_functions{
        "eval", "exec", "open", "__import__", "compile"
    };
};

struct TranslatorConfig {
    bool native_host_check = false;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;          ///< Empty = stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    std::filesystem::path metrics_file;     ///< Empty = metrics discarded
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    ServerConfig server;
    SandboxConfig sandbox;
    ToolchainConfig toolchains;
    SecurityConfig security;
    TranslatorConfig translator;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Apply SANDBOX_TIMEOUT, MAX_MEMORY_MB, MAX_OUTPUT_SIZE, SANDBOX_PORT
 *        and JAC_EXECUTOR_PATH from the environment.
 *
 * Values that do not parse as positive integers are reported and ignored.
 */
Result<void> apply_env_overrides(Config& config);

}  // namespace codelab

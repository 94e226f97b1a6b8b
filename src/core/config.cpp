/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <charconv>
#include <cstdlib>
#include <string_view>

#include <toml++/toml.hpp>

namespace codelab {

namespace {

std::vector<std::string> read_string_array(const toml::node_view<toml::node>& node,
                                           std::vector<std::string> fallback) {
    const auto* arr = node.as_array();
    if (!arr) return fallback;

    std::vector<std::string> out;
    out.reserve(arr->size());
    for (const auto& element : *arr) {
        if (auto value = element.value<std::string>()) {
            out.push_back(*value);
        }
    }
    return out;
}

/**
 * @brief Parse an environment variable as a positive integer.
 *
 * Returns 0 when unset; an error when set but malformed.
 */
Result<uint64_t> env_u64(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw || *raw == '\0') return uint64_t{0};

    std::string_view text(raw);
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
        return Error{ErrorCode::InvalidArgument,
                     std::string{name} + " must be a positive integer, got '" + raw + "'"};
    }
    return value;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Io, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [server]
        if (auto server = tbl["server"]; server.is_table()) {
            config.server.host = server["host"].value_or(std::string{"0.0.0.0"});
            config.server.port = static_cast<uint16_t>(
                server["port"].value_or(int64_t{8080}));
            config.server.worker_threads = static_cast<uint32_t>(
                server["worker_threads"].value_or(int64_t{0}));
            config.server.max_pending_requests = static_cast<uint32_t>(
                server["max_pending_requests"].value_or(int64_t{64}));
            config.server.max_request_bytes = static_cast<uint64_t>(
                server["max_request_bytes"].value_or(int64_t{1048576}));
            config.server.max_sessions = static_cast<uint32_t>(
                server["max_sessions"].value_or(int64_t{10000}));
        }

        // [sandbox]
        if (auto sandbox = tbl["sandbox"]; sandbox.is_table()) {
            config.sandbox.timeout_s = static_cast<uint32_t>(
                sandbox["timeout_s"].value_or(int64_t{30}));
            config.sandbox.compile_timeout_s = static_cast<uint32_t>(
                sandbox["compile_timeout_s"].value_or(int64_t{30}));
            config.sandbox.java_compile_timeout_s = static_cast<uint32_t>(
                sandbox["java_compile_timeout_s"].value_or(int64_t{10}));
            config.sandbox.max_memory_mb = static_cast<uint64_t>(
                sandbox["max_memory_mb"].value_or(int64_t{128}));
            config.sandbox.enforce_memory_limit = sandbox["enforce_memory_limit"].value_or(true);
            config.sandbox.max_output_bytes = static_cast<uint64_t>(
                sandbox["max_output_bytes"].value_or(int64_t{10240}));
            config.sandbox.max_code_bytes = static_cast<uint64_t>(
                sandbox["max_code_bytes"].value_or(int64_t{102400}));
            config.sandbox.scratch_dir = sandbox["scratch_dir"].value_or(std::string{});
        }

        // [toolchains]
        if (auto tools = tbl["toolchains"]; tools.is_table()) {
            config.toolchains.python = tools["python"].value_or(std::string{"python3"});
            config.toolchains.node = tools["node"].value_or(std::string{"node"});
            config.toolchains.javac = tools["javac"].value_or(std::string{"javac"});
            config.toolchains.java = tools["java"].value_or(std::string{"java"});
            config.toolchains.gcc = tools["gcc"].value_or(std::string{"gcc"});
            config.toolchains.gxx = tools["gxx"].value_or(std::string{"g++"});
            config.toolchains.jac = tools["jac"].value_or(std::string{});
        }

        // [security]
        if (auto security = tbl["security"]; security.is_table()) {
            config.security.enabled = security["enabled"].value_or(true);
            config.security.blocked_imports = read_string_array(
                security["blocked_imports"], config.security.blocked_imports);
            config.security.blocked_functions = read_string_array(
                security["blocked_functions"], config.security.blocked_functions);
        }

        // [translator]
        if (auto translator = tbl["translator"]; translator.is_table()) {
            config.translator.native_host_check = translator["native_host_check"].value_or(false);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.metrics_file = telemetry["metrics_file"].value_or(std::string{});
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<void> apply_env_overrides(Config& config) {
    std::string problems;

    auto apply = [&problems](const char* name, auto&& assign) {
        auto value = env_u64(name);
        if (!value) {
            if (!problems.empty()) problems += "; ";
            problems += value.error().message;
        } else if (*value != 0) {
            assign(*value);
        }
    };

    apply("SANDBOX_TIMEOUT", [&](uint64_t v) { config.sandbox.timeout_s = static_cast<uint32_t>(v); });
    apply("MAX_MEMORY_MB", [&](uint64_t v) { config.sandbox.max_memory_mb = v; });
    apply("MAX_OUTPUT_SIZE", [&](uint64_t v) { config.sandbox.max_output_bytes = v; });
    apply("SANDBOX_PORT", [&](uint64_t v) { config.server.port = static_cast<uint16_t>(v); });

    if (const char* jac = std::getenv("JAC_EXECUTOR_PATH"); jac && *jac != '\0') {
        config.toolchains.jac = jac;
    }

    if (!problems.empty()) {
        return Error{ErrorCode::InvalidArgument, problems};
    }
    return Result<void>{};
}

}  // namespace codelab

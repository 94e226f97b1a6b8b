/**
 * @file sandboxed_executor.cpp
 * @brief SandboxedExecutor implementation.
 * @author Dimitris Kafetzis
 */

#include "sandbox/sandboxed_executor.hpp"

#include "sandbox/scratch_directory.hpp"

#include <algorithm>
#include <utility>

namespace codelab {

namespace {

constexpr uint64_t kMiB = 1024 * 1024;

void append_line(std::string& text, std::string_view line) {
    if (!text.empty() && text.back() != '\n') text += '\n';
    text += line;
}

}  // anonymous namespace

SandboxedExecutor::SandboxedExecutor(SandboxConfig config, const RunnerRegistry& registry)
    : config_(std::move(config))
    , registry_(registry) {}

bool SandboxedExecutor::supports(Language language) const noexcept {
    return registry_.supports(language);
}

RunLimits SandboxedExecutor::limits() const {
    RunLimits limits;
    limits.run_timeout = config_.run_timeout();
    limits.compile_timeout = std::chrono::seconds(config_.compile_timeout_s);
    limits.java_compile_timeout = std::chrono::seconds(config_.java_compile_timeout_s);
    if (config_.enforce_memory_limit) {
        limits.memory_limit_bytes = config_.max_memory_mb * kMiB;
    }
    limits.cpu_seconds = config_.timeout_s + 1;
    limits.capture_limit_bytes = config_.max_output_bytes;
    return limits;
}

ExecutionResult SandboxedExecutor::execute(std::string_view code,
                                           std::string_view language_id) const {
    auto language = parse_language(language_id);
    if (!language) {
        return make_rejection(ExecutionStatus::UnsupportedLanguage,
                              "Unsupported language: " + std::string(language_id));
    }
    return execute(code, *language);
}

ExecutionResult SandboxedExecutor::execute(std::string_view code, Language language,
                                           std::string_view stdin_data,
                                           std::stop_token stop) const {
    // Resolve before touching the filesystem.
    auto runner = registry_.find(language);
    if (!runner) {
        return make_rejection(ExecutionStatus::UnsupportedLanguage, runner.error().message);
    }

    auto workspace = ScratchDirectory::create(config_.scratch_dir);
    if (!workspace) {
        return make_rejection(ExecutionStatus::Failure,
                              "Sandbox workspace unavailable: " + workspace.error().message);
    }

    auto artifact = (*runner)->prepare(code, workspace->path());
    if (!artifact) {
        return make_rejection(ExecutionStatus::Failure,
                              "Could not prepare source: " + artifact.error().message);
    }

    auto raw = (*runner)->run(*artifact, limits(), stdin_data, std::move(stop));
    if (!raw) {
        const auto& error = raw.error();
        return make_rejection(ExecutionStatus::Failure, error.message,
                              error.code == ErrorCode::SpawnFailed ? kMissingToolExitCode : 1);
    }

    return to_result(*raw);
}

ExecutionResult SandboxedExecutor::to_result(const RawRunResult& raw) const {
    const auto& process = raw.process;

    ExecutionResult result;
    result.exit_code = process.exit_code;
    result.execution_time_seconds = static_cast<double>(process.wall_time.count()) / 1e6;
    result.memory_used_bytes = process.peak_rss_bytes;

    std::string out = process.stdout_data;
    std::string err = process.stderr_data;
    std::string diagnostic;

    if (process.cancelled) {
        result.status = ExecutionStatus::Failure;
        diagnostic = "Execution cancelled";
    } else if (raw.compile_failed) {
        result.status = ExecutionStatus::CompilationError;
        // Compiler chatter on stdout belongs with its diagnostics.
        if (!out.empty()) {
            append_line(err, out);
            out.clear();
        }
        result.memory_used_bytes = 0;
        if (raw.compile_timed_out) {
            result.exit_code = kTimeoutExitCode;
            diagnostic = "Compilation timed out after "
                       + std::to_string(process.wall_time.count() / 1000000) + " seconds";
        }
    } else if (process.timed_out) {
        result.status = ExecutionStatus::Timeout;
        result.exit_code = kTimeoutExitCode;
        diagnostic = "Execution timed out after " + std::to_string(config_.timeout_s) + " seconds";
    } else {
        result.status = process.exit_code == 0 ? ExecutionStatus::Success
                                                : ExecutionStatus::Failure;
    }

    // Room is kept for the diagnostic so the cap holds with it appended.
    const uint64_t reserved = diagnostic.empty() ? 0 : diagnostic.size() + 1;
    const uint64_t budget = config_.max_output_bytes > reserved
                          ? config_.max_output_bytes - reserved : 0;
    truncate_output(out, err, process.stdout_overflow || process.stderr_overflow, budget);
    if (!diagnostic.empty()) append_line(err, diagnostic);

    result.stdout_data = std::move(out);
    if (!err.empty()) result.stderr_data = std::move(err);
    return result;
}

bool SandboxedExecutor::truncate_output(std::string& stdout_data, std::string& stderr_data,
                                        bool overflowed, uint64_t budget) {
    const uint64_t total = stdout_data.size() + stderr_data.size();
    if (!overflowed && total <= budget) return false;

    if (stdout_data.size() >= budget) {
        stdout_data.resize(static_cast<size_t>(budget));
        stderr_data.clear();
        stdout_data += kTruncationMarker;
        return true;
    }

    const uint64_t room = budget - stdout_data.size();
    if (stderr_data.size() >= room && !stderr_data.empty()) {
        stderr_data.resize(static_cast<size_t>(room));
        stderr_data += kTruncationMarker;
    } else {
        stdout_data += kTruncationMarker;
    }
    return true;
}

}  // namespace codelab

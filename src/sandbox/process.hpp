/**
 * @file process.hpp
 * @brief Child process spawning with captured I/O, rlimits and group kill.
 * @author Dimitris Kafetzis
 *
 * Every child is the leader of its own process group. The whole group is
 * SIGKILLed on timeout, on cancellation, and unconditionally before the
 * leader is reaped, so no descendant outlives a run.
 */

#pragma once

#include "core/result.hpp"

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace codelab {

/**
 * @brief What to run and under which limits.
 */
struct ProcessSpec {
    std::vector<std::string> argv;                  ///< argv[0] is looked up on PATH
    std::filesystem::path working_dir;
    std::string stdin_data;
    std::chrono::milliseconds timeout{30000};
    uint64_t capture_limit_bytes = 1024 * 1024;     ///< Per stream; excess is drained and dropped
    std::optional<uint64_t> address_space_bytes;    ///< RLIMIT_AS
    std::optional<uint32_t> cpu_seconds;            ///< RLIMIT_CPU
    uint64_t max_file_bytes = 16 * 1024 * 1024;     ///< RLIMIT_FSIZE
};

struct ProcessOutcome {
    std::string stdout_data;
    std::string stderr_data;
    bool stdout_overflow = false;
    bool stderr_overflow = false;
    int exit_code = 0;                  ///< 128 + signal when signalled
    int term_signal = 0;
    bool timed_out = false;
    bool cancelled = false;
    std::chrono::microseconds wall_time{0};
    uint64_t peak_rss_bytes = 0;
};

/**
 * @brief Run a child process to completion, timeout or cancellation.
 *
 * Returns ErrorCode::SpawnFailed when the executable cannot be started
 * (the message names the tool), ErrorCode::Io for pipe/fork failures.
 * A non-zero exit, a timeout and a cancellation are all outcomes, not
 * errors.
 */
[[nodiscard]] Result<ProcessOutcome> run_process(const ProcessSpec& spec,
                                                 std::stop_token stop = {});

/**
 * @brief Resolve a tool name against PATH (or check an explicit path).
 */
[[nodiscard]] std::optional<std::filesystem::path> find_executable(const std::string& name);

}  // namespace codelab

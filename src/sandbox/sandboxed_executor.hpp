/**
 * @file sandboxed_executor.hpp
 * @brief Runs one submission in an isolated, bounded child process group.
 * @author Dimitris Kafetzis
 *
 * The executor trusts the security boundary in front of it and does not
 * re-scan. It owns nothing per request beyond the scratch directory, which
 * is gone before execute() returns.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "sandbox/runner.hpp"
#include "sandbox/runner_registry.hpp"

#include <stop_token>
#include <string>
#include <string_view>

namespace codelab {

class SandboxedExecutor {
public:
    static constexpr std::string_view kTruncationMarker = "\n[Output truncated due to size limit]";
    static constexpr int kTimeoutExitCode = 124;
    static constexpr int kMissingToolExitCode = 127;

    SandboxedExecutor(SandboxConfig config, const RunnerRegistry& registry);

    /**
     * @brief Execute code with the runner registered for `language`.
     *
     * Always returns a terminal result: an unknown language, a missing
     * toolchain, a timeout and a cancellation are all reported in the
     * result, never thrown.
     */
    [[nodiscard]] ExecutionResult execute(std::string_view code, Language language,
                                          std::string_view stdin_data = {},
                                          std::stop_token stop = {}) const;

    /// Convenience overload taking a wire identifier.
    [[nodiscard]] ExecutionResult execute(std::string_view code,
                                          std::string_view language_id) const;

    [[nodiscard]] bool supports(Language language) const noexcept;

    [[nodiscard]] const RunnerRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] const SandboxConfig& config() const noexcept { return config_; }

    /// Limits derived from the sandbox configuration.
    [[nodiscard]] RunLimits limits() const;

    /**
     * @brief Cut stdout + stderr down to `budget` bytes in total.
     *
     * stdout keeps priority; stderr gets what is left. The marker is
     * appended to the stream that was cut. Returns true when anything was
     * dropped (or `overflowed` says the child wrote more than was captured).
     */
    static bool truncate_output(std::string& stdout_data, std::string& stderr_data,
                                bool overflowed, uint64_t budget);

private:
    [[nodiscard]] ExecutionResult to_result(const RawRunResult& raw) const;

    SandboxConfig config_;
    const RunnerRegistry& registry_;
};

}  // namespace codelab

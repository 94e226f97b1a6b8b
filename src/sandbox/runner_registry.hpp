/**
 * @file runner_registry.hpp
 * @brief Language → runner lookup table.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "sandbox/runner.hpp"

#include <memory>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace codelab {

/**
 * @brief Owns one IRunner per supported language.
 *
 * Populated at startup and read-only afterwards; lookups need no locking.
 */
class RunnerRegistry {
public:
    RunnerRegistry() = default;

    RunnerRegistry(RunnerRegistry&&) noexcept = default;
    RunnerRegistry& operator=(RunnerRegistry&&) noexcept = default;
    RunnerRegistry(const RunnerRegistry&) = delete;
    RunnerRegistry& operator=(const RunnerRegistry&) = delete;

    /// Register a runner, replacing any runner for the same language.
    void register_runner(std::unique_ptr<IRunner> runner);

    [[nodiscard]] Result<const IRunner*> find(Language language) const;

    /// Resolve a wire identifier (aliases included) and look it up.
    [[nodiscard]] Result<const IRunner*> resolve(std::string_view language_id) const;

    [[nodiscard]] bool supports(Language language) const noexcept;

    /// Registered languages in declaration order.
    [[nodiscard]] std::vector<Language> languages() const;

    [[nodiscard]] size_t size() const noexcept { return runners_.size(); }

    /**
     * @brief Standard runner set for the configured toolchains.
     *
     * The teaching interpreter is registered only when configured; without
     * it teaching-dialect code is translated and run on the host runner.
     */
    [[nodiscard]] static RunnerRegistry from_config(const ToolchainConfig& toolchains);

private:
    std::unordered_map<Language, std::unique_ptr<IRunner>> runners_;
};

}  // namespace codelab

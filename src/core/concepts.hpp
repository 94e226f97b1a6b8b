/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for CodeLab interfaces.
 * @author Dimitris Kafetzis
 *
 * Compile-time interface constraints for the seams that tests replace:
 * the orchestrator is parameterized on its executor and the gateway on its
 * orchestrator, with no virtual dispatch on the request path.
 */

#pragma once

#include "core/types.hpp"

#include <concepts>
#include <future>
#include <optional>
#include <stop_token>
#include <string_view>
#include <vector>

namespace codelab {

// ─────────────────────────────────────────────
// ExecutorLike
// ─────────────────────────────────────────────

/**
 * @concept ExecutorLike
 * @brief Types that can run code for a resolved language.
 *
 * Satisfied by SandboxedExecutor; tests use a counting fake to prove what
 * the orchestrator does and does not forward.
 */
template <typename T>
concept ExecutorLike = requires(const T executor,
                                std::string_view code,
                                Language language,
                                std::stop_token stop) {
    { executor.execute(code, language, code, stop) } -> std::same_as<ExecutionResult>;
    { executor.supports(language) } -> std::convertible_to<bool>;
};

// ─────────────────────────────────────────────
// OrchestratorLike
// ─────────────────────────────────────────────

/**
 * @concept OrchestratorLike
 * @brief What the request gateway needs from the pipeline behind it.
 */
template <typename T>
concept OrchestratorLike = requires(T orchestrator,
                                    const ExecutionRequest& request,
                                    std::string_view code,
                                    TranslationDirection direction,
                                    Dialect dialect,
                                    const UserId& user,
                                    std::stop_token stop) {
    { orchestrator.submit(request, stop) } -> std::same_as<ExecutionResult>;
    { orchestrator.translate(code, direction) } -> std::same_as<TranslationResult>;
    { orchestrator.validate_syntax(code, dialect) } -> std::same_as<std::vector<std::string>>;
    { orchestrator.session(user) } -> std::same_as<std::optional<SessionStats>>;
    { orchestrator.supported_languages() } -> std::same_as<std::vector<Language>>;
};

}  // namespace codelab

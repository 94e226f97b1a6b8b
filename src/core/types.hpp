/**
 * @file types.hpp
 * @brief Fundamental types used throughout the CodeLab sandbox.
 * @author Dimitris Kafetzis
 *
 * Defines the language and dialect vocabulary, execution statuses, and the
 * request/result records that flow through the execution pipeline. All
 * records are plain values: built per request, moved to the caller, never
 * retained by the core.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codelab {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using UserId = std::string;
using TaskId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Languages & Dialects
// ─────────────────────────────────────────────

enum class Language : uint8_t {
    Python,
    JavaScript,
    Java,
    C,
    Cpp,
    Jac             ///< Teaching dialect
};

[[nodiscard]] constexpr std::string_view to_string(Language lang) noexcept {
    switch (lang) {
        case Language::Python:     return "python";
        case Language::JavaScript: return "javascript";
        case Language::Java:       return "java";
        case Language::C:          return "c";
        case Language::Cpp:        return "cpp";
        case Language::Jac:        return "jac";
    }
    return "unknown";
}

/**
 * @brief Resolve a wire identifier (or one of its aliases) to a Language.
 */
[[nodiscard]] std::optional<Language> parse_language(std::string_view id) noexcept;

/// Every language the daemon knows how to name, in declaration order.
[[nodiscard]] const std::vector<Language>& all_languages();

enum class Dialect : uint8_t {
    Teaching,      ///< Marker-significant (JAC)
    Host           ///< Indentation-significant (Python)
};

[[nodiscard]] constexpr std::string_view to_string(Dialect dialect) noexcept {
    switch (dialect) {
        case Dialect::Teaching: return "teaching";
        case Dialect::Host:     return "host";
    }
    return "unknown";
}

[[nodiscard]] std::optional<Dialect> parse_dialect(std::string_view id) noexcept;

enum class TranslationDirection : uint8_t {
    TeachingToHost,
    HostToTeaching
};

[[nodiscard]] constexpr std::string_view to_string(TranslationDirection dir) noexcept {
    switch (dir) {
        case TranslationDirection::TeachingToHost: return "teaching_to_host";
        case TranslationDirection::HostToTeaching: return "host_to_teaching";
    }
    return "unknown";
}

[[nodiscard]] std::optional<TranslationDirection> parse_direction(std::string_view id) noexcept;

// ─────────────────────────────────────────────
// Translation Records
// ─────────────────────────────────────────────

struct TranslationRequest {
    std::string source_code;
    TranslationDirection direction = TranslationDirection::TeachingToHost;
};

struct TranslationMetadata {
    size_t original_length = 0;
    size_t translated_length = 0;
    TranslationDirection direction = TranslationDirection::TeachingToHost;
    std::string timestamp;              ///< Unix seconds
};

/**
 * @brief Outcome of one translation. success == errors.empty().
 */
struct TranslationResult {
    bool success = false;
    std::string translated_code;
    std::string source_label;
    std::string target_label;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    TranslationMetadata metadata;
};

// ─────────────────────────────────────────────
// Execution Records
// ─────────────────────────────────────────────

enum class ExecutionStatus : uint8_t {
    Success,
    Failure,
    SecurityViolation,
    Timeout,
    CompilationError,
    UnsupportedLanguage
};

[[nodiscard]] constexpr std::string_view to_string(ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::Success:             return "success";
        case ExecutionStatus::Failure:             return "failure";
        case ExecutionStatus::SecurityViolation:   return "security_violation";
        case ExecutionStatus::Timeout:             return "timeout";
        case ExecutionStatus::CompilationError:    return "compilation_error";
        case ExecutionStatus::UnsupportedLanguage: return "unsupported_language";
    }
    return "unknown";
}

struct ExecutionRequest {
    std::string code;
    std::string language;               ///< Wire identifier, resolved by the orchestrator
    UserId user_id;
    std::optional<TaskId> task_id;
    std::string stdin_data;
};

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::Failure;
    std::string stdout_data;
    std::optional<std::string> stderr_data;
    int exit_code = 0;
    double execution_time_seconds = 0.0;
    uint64_t memory_used_bytes = 0;     ///< Peak RSS, 0 when unmeasured

    [[nodiscard]] bool succeeded() const noexcept {
        return status == ExecutionStatus::Success && exit_code == 0;
    }

    [[nodiscard]] size_t output_size() const noexcept {
        return stdout_data.size() + (stderr_data ? stderr_data->size() : 0);
    }
};

/**
 * @brief Build a result that never reached a child process.
 */
[[nodiscard]] ExecutionResult make_rejection(ExecutionStatus status,
                                             std::string message,
                                             int exit_code = 1);

// ─────────────────────────────────────────────
// Session Statistics
// ─────────────────────────────────────────────

/**
 * @brief Per-user aggregate execution counters.
 */
struct SessionStats {
    std::string session_id;
    UserId user_id;
    Timestamp started_at;
    uint64_t total_executions = 0;
    uint64_t successful_executions = 0;
    uint64_t failed_executions = 0;
    double total_execution_time_seconds = 0.0;
    std::map<std::string, uint64_t> language_counts;

    /// Percentage in [0, 100]; 0 when nothing ran yet.
    [[nodiscard]] double success_rate() const noexcept {
        if (total_executions == 0) return 0.0;
        return 100.0 * static_cast<double>(successful_executions)
               / static_cast<double>(total_executions);
    }
};

}  // namespace codelab

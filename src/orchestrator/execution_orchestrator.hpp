/**
 * @file execution_orchestrator.hpp
 * @brief Top-level pipeline facade: validate → translate → execute → account.
 * @author Dimitris Kafetzis
 *
 * Provides a single entry point for:
 *   1. Running a submission in any supported language
 *   2. Translating between the teaching and host dialects
 *   3. Heuristic (and optionally native) syntax validation
 *   4. Per-user session statistics
 *
 * Template-parameterized on ExecutorT for testability (SandboxedExecutor or
 * a counting fake). No exception crosses this boundary: every failure is
 * folded into an ExecutionResult or a TranslationResult.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "orchestrator/session_registry.hpp"
#include "sandbox/host_syntax_checker.hpp"
#include "sandbox/runner_registry.hpp"
#include "sandbox/sandboxed_executor.hpp"
#include "sandbox/security_validator.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"
#include "translator/dialect_translator.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace codelab {

template <ExecutorLike ExecutorT = SandboxedExecutor>
class ExecutionOrchestrator {
public:
    static constexpr std::string_view kAnonymousUser = "anonymous";

    struct Options {
        Config config;
        std::unique_ptr<ILogSink> log_sink;         ///< nullptr = discard
        std::unique_ptr<ILogSink> metrics_sink;     ///< nullptr = discard
        LogLevel log_level = LogLevel::Info;
    };

    explicit ExecutionOrchestrator(Options opts);
    ~ExecutionOrchestrator();

    // Non-copyable, non-movable
    ExecutionOrchestrator(const ExecutionOrchestrator&) = delete;
    ExecutionOrchestrator& operator=(const ExecutionOrchestrator&) = delete;

    // ── Execution ────────────────────────────

    /**
     * @brief Run one request through the whole pipeline.
     *
     * Order: request checks → language resolution → security validation →
     * translation (teaching code without a teaching runner) → execution →
     * session update → metrics. The executor is never reached for a
     * rejected request.
     */
    ExecutionResult submit(const ExecutionRequest& request, std::stop_token stop = {});

    /// submit() on the worker pool; cancelled when the orchestrator shuts down.
    std::future<ExecutionResult> submit_async(ExecutionRequest request);

    /// Always translate teaching → host and run on the host runner.
    ExecutionResult translate_and_run(const ExecutionRequest& request, std::stop_token stop = {});

    // ── Translation ──────────────────────────
    TranslationResult translate(std::string_view code, TranslationDirection direction);
    std::vector<std::string> validate_syntax(std::string_view code, Dialect dialect);

    // ── Sessions ─────────────────────────────
    [[nodiscard]] std::optional<SessionStats> session(const UserId& user) const;
    [[nodiscard]] std::vector<SessionStats> sessions() const;

    /// Languages a request may name: every runner, plus the teaching
    /// dialect when it can be translated onto the host runner.
    [[nodiscard]] std::vector<Language> supported_languages() const;

    // ── Accessors (for testing) ─────────────
    ExecutorT& executor() { return executor_; }
    Logger& logger() { return logger_; }
    MetricsCollector& metrics() { return metrics_; }
    const Config& config() const { return config_; }
    const SecurityValidator& validator() const { return validator_; }
    const DialectTranslator& translator() const { return translator_; }

private:
    ExecutionResult submit_impl(const ExecutionRequest& request, std::stop_token stop,
                                bool force_translation);
    ExecutionResult run_pipeline(const std::string& code, Language language,
                                 const std::string& stdin_data, std::stop_token stop,
                                 const UserId& user, bool force_translation);
    ExecutionResult run_translated(const std::string& code, const std::string& stdin_data,
                                   std::stop_token stop, const UserId& user);
    std::optional<ExecutionResult> reject_if_unsafe(std::string_view code, Language language,
                                                    const UserId& user);
    [[nodiscard]] bool accepts(Language language) const;

    static std::unique_ptr<ILogSink> or_null(std::unique_ptr<ILogSink> sink);

    Config config_;
    Logger logger_;
    MetricsCollector metrics_;

    RunnerRegistry registry_;
    ExecutorT executor_;
    SecurityValidator validator_;
    DialectTranslator translator_;
    SessionRegistry sessions_;
    std::optional<HostSyntaxChecker> host_checker_;

    // Declared last: workers are joined before anything they use is destroyed.
    ThreadPool pool_;
};

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <ExecutorLike ExecutorT>
std::unique_ptr<ILogSink> ExecutionOrchestrator<ExecutorT>::or_null(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

template <ExecutorLike ExecutorT>
ExecutionOrchestrator<ExecutorT>::ExecutionOrchestrator(Options opts)
    : config_(std::move(opts.config))
    , logger_(or_null(std::move(opts.log_sink)), opts.log_level)
    , metrics_(or_null(std::move(opts.metrics_sink)))
    , registry_(RunnerRegistry::from_config(config_.toolchains))
    , executor_(config_.sandbox, registry_)
    , validator_(config_.security)
    , translator_(PatternTable::standard())
    , sessions_(config_.server.max_sessions)
    , pool_(config_.server.worker_threads, config_.server.max_pending_requests) {
    if (config_.translator.native_host_check) {
        host_checker_.emplace(config_.toolchains.python);
        if (!host_checker_->available()) {
            logger_.warn("Native host syntax check disabled: " + config_.toolchains.python
                         + " not found");
            host_checker_.reset();
        }
    }
    logger_.info("Execution pipeline ready: " + std::to_string(registry_.size())
                 + " runners, timeout " + std::to_string(config_.sandbox.timeout_s) + "s, memory "
                 + std::to_string(config_.sandbox.max_memory_mb) + " MB, output cap "
                 + std::to_string(config_.sandbox.max_output_bytes) + " bytes");
}

template <ExecutorLike ExecutorT>
ExecutionOrchestrator<ExecutorT>::~ExecutionOrchestrator() {
    pool_.shutdown();
    metrics_.flush();
    logger_.flush();
}

// ─────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────

template <ExecutorLike ExecutorT>
ExecutionResult ExecutionOrchestrator<ExecutorT>::submit(const ExecutionRequest& request,
                                                         std::stop_token stop) {
    return submit_impl(request, std::move(stop), false);
}

template <ExecutorLike ExecutorT>
ExecutionResult ExecutionOrchestrator<ExecutorT>::translate_and_run(const ExecutionRequest& request,
                                                                    std::stop_token stop) {
    return submit_impl(request, std::move(stop), true);
}

template <ExecutorLike ExecutorT>
std::future<ExecutionResult> ExecutionOrchestrator<ExecutorT>::submit_async(ExecutionRequest request) {
    return pool_.submit_cancellable(
        [this, request = std::move(request)](std::stop_token stop) {
            return submit(request, stop);
        });
}

template <ExecutorLike ExecutorT>
ExecutionResult ExecutionOrchestrator<ExecutorT>::submit_impl(const ExecutionRequest& request,
                                                              std::stop_token stop,
                                                              bool force_translation) {
    const auto started = std::chrono::steady_clock::now();
    const UserId user = request.user_id.empty() ? UserId(kAnonymousUser) : request.user_id;

    std::optional<Language> language = force_translation
        ? std::optional<Language>(Language::Jac)
        : parse_language(request.language);
    const std::string language_label = language ? std::string(to_string(*language))
                                                : request.language;

    ExecutionResult result;
    try {
        const bool blank = std::all_of(request.code.begin(), request.code.end(),
            [](unsigned char c) { return std::isspace(c) != 0; });

        if (blank) {
            result = make_rejection(ExecutionStatus::Failure, "Code cannot be empty");
        } else if (request.code.size() > config_.sandbox.max_code_bytes) {
            result = make_rejection(ExecutionStatus::Failure,
                "Code exceeds maximum allowed size of "
                + std::to_string(config_.sandbox.max_code_bytes) + " bytes");
        } else if (!language || !accepts(*language)) {
            result = make_rejection(ExecutionStatus::UnsupportedLanguage,
                                    "Unsupported language: " + request.language);
        } else {
            result = run_pipeline(request.code, *language, request.stdin_data,
                                  std::move(stop), user, force_translation);
        }
    } catch (const std::exception& e) {
        logger_.error("Execution pipeline fault for user " + user + ": " + e.what());
        result = make_rejection(ExecutionStatus::Failure, std::string("Internal error: ") + e.what());
    }

    result.execution_time_seconds = std::max(
        result.execution_time_seconds,
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());

    auto stats = sessions_.record(user, language_label, result);

    if (language) metrics_.record_execution(user, *language, result);
    metrics_.record_session_update(stats);

    logger_.info("Execution finished: user=" + user
                 + (request.task_id ? " task=" + *request.task_id : std::string{})
                 + " language=" + language_label
                 + " status=" + std::string(to_string(result.status))
                 + " exit=" + std::to_string(result.exit_code)
                 + " time=" + std::to_string(result.execution_time_seconds) + "s");
    return result;
}

template <ExecutorLike ExecutorT>
ExecutionResult ExecutionOrchestrator<ExecutorT>::run_pipeline(const std::string& code,
                                                               Language language,
                                                               const std::string& stdin_data,
                                                               std::stop_token stop,
                                                               const UserId& user,
                                                               bool force_translation) {
    if (auto rejected = reject_if_unsafe(code, language, user)) {
        return std::move(*rejected);
    }

    if (language == Language::Jac && (force_translation || !executor_.supports(Language::Jac))) {
        return run_translated(code, stdin_data, std::move(stop), user);
    }
    return executor_.execute(code, language, stdin_data, std::move(stop));
}

template <ExecutorLike ExecutorT>
ExecutionResult ExecutionOrchestrator<ExecutorT>::run_translated(const std::string& code,
                                                                 const std::string& stdin_data,
                                                                 std::stop_token stop,
                                                                 const UserId& user) {
    auto translation = translate(code, TranslationDirection::TeachingToHost);
    if (!translation.success) {
        std::string message = "Translation failed";
        for (const auto& error : translation.errors) message += "\n" + error;
        return make_rejection(ExecutionStatus::Failure, std::move(message));
    }

    // Translated code is checked again under host rules.
    if (auto rejected = reject_if_unsafe(translation.translated_code, Language::Python, user)) {
        return std::move(*rejected);
    }

    if (!executor_.supports(Language::Python)) {
        return make_rejection(ExecutionStatus::UnsupportedLanguage,
                              "No host runner available for translated teaching code");
    }
    logger_.debug("Running teaching code translated to host ("
                  + std::to_string(translation.warnings.size()) + " warnings)");
    return executor_.execute(translation.translated_code, Language::Python, stdin_data,
                             std::move(stop));
}

template <ExecutorLike ExecutorT>
std::optional<ExecutionResult> ExecutionOrchestrator<ExecutorT>::reject_if_unsafe(
    std::string_view code, Language language, const UserId& user) {
    auto verdict = validator_.validate(code, language);
    if (verdict.allowed) return std::nullopt;

    const std::string reason = verdict.reason.value_or("Security violation");
    logger_.warn("Security violation: user=" + user + " language="
                 + std::string(to_string(language)) + " reason=" + reason);
    metrics_.record_security_violation(user, to_string(language), reason);
    return make_rejection(ExecutionStatus::SecurityViolation, "Security violation: " + reason);
}

template <ExecutorLike ExecutorT>
bool ExecutionOrchestrator<ExecutorT>::accepts(Language language) const {
    if (executor_.supports(language)) return true;
    return language == Language::Jac && executor_.supports(Language::Python);
}

template <ExecutorLike ExecutorT>
std::vector<Language> ExecutionOrchestrator<ExecutorT>::supported_languages() const {
    std::vector<Language> out;
    for (auto language : all_languages()) {
        if (accepts(language)) out.push_back(language);
    }
    return out;
}

// ─────────────────────────────────────────────
// Translation
// ─────────────────────────────────────────────

template <ExecutorLike ExecutorT>
TranslationResult ExecutionOrchestrator<ExecutorT>::translate(std::string_view code,
                                                              TranslationDirection direction) {
    auto result = translator_.translate(code, direction);
    metrics_.record_translation(direction, result);
    if (!result.success) {
        logger_.warn("Translation " + std::string(to_string(direction)) + " failed: "
                     + (result.errors.empty() ? std::string("unknown") : result.errors.front()));
    } else {
        logger_.debug("Translation " + std::string(to_string(direction)) + ": "
                      + std::to_string(result.metadata.original_length) + " -> "
                      + std::to_string(result.metadata.translated_length) + " bytes, "
                      + std::to_string(result.warnings.size()) + " warnings");
    }
    return result;
}

template <ExecutorLike ExecutorT>
std::vector<std::string> ExecutionOrchestrator<ExecutorT>::validate_syntax(std::string_view code,
                                                                           Dialect dialect) {
    auto problems = translator_.validate_syntax(code, dialect);

    if (dialect == Dialect::Host && host_checker_) {
        auto native = host_checker_->check(code);
        if (native) {
            problems.insert(problems.end(), native->begin(), native->end());
        } else {
            logger_.warn("Native host syntax check unavailable: " + native.error().message);
        }
    }
    return problems;
}

// ─────────────────────────────────────────────
// Sessions
// ─────────────────────────────────────────────

template <ExecutorLike ExecutorT>
std::optional<SessionStats> ExecutionOrchestrator<ExecutorT>::session(const UserId& user) const {
    return sessions_.get(user);
}

template <ExecutorLike ExecutorT>
std::vector<SessionStats> ExecutionOrchestrator<ExecutorT>::sessions() const {
    return sessions_.all();
}

}  // namespace codelab

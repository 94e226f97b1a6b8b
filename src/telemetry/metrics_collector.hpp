/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace codelab {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_execution(const UserId& user, Language language, const ExecutionResult& result);
    void record_translation(TranslationDirection direction, const TranslationResult& result);
    void record_security_violation(const UserId& user, std::string_view language,
                                   std::string_view reason);
    void record_session_update(const SessionStats& stats);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

    [[nodiscard]] uint64_t events_emitted() const noexcept { return events_.load(); }

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
    std::atomic<uint64_t> events_{0};

    void emit(std::string_view json_line);
};

}  // namespace codelab

/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <sstream>

namespace codelab {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_execution(const UserId& user, Language language,
                                        const ExecutionResult& result) {
    std::ostringstream oss;
    oss << R"({"event":"execution")"
        << R"(,"user":")" << json_escape(user) << "\""
        << R"(,"language":")" << to_string(language) << "\""
        << R"(,"status":")" << to_string(result.status) << "\""
        << R"(,"exit_code":)" << result.exit_code
        << R"(,"duration_s":)" << result.execution_time_seconds
        << R"(,"memory_bytes":)" << result.memory_used_bytes
        << R"(,"output_bytes":)" << result.output_size()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_translation(TranslationDirection direction,
                                          const TranslationResult& result) {
    std::ostringstream oss;
    oss << R"({"event":"translation")"
        << R"(,"direction":")" << to_string(direction) << "\""
        << R"(,"success":)" << (result.success ? "true" : "false")
        << R"(,"warnings":)" << result.warnings.size()
        << R"(,"original_length":)" << result.metadata.original_length
        << R"(,"translated_length":)" << result.metadata.translated_length
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_security_violation(const UserId& user, std::string_view language,
                                                 std::string_view reason) {
    std::ostringstream oss;
    oss << R"({"event":"security_violation")"
        << R"(,"user":")" << json_escape(user) << "\""
        << R"(,"language":")" << json_escape(language) << "\""
        << R"(,"reason":")" << json_escape(reason) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_session_update(const SessionStats& stats) {
    std::ostringstream oss;
    oss << R"({"event":"session_update")"
        << R"(,"session":")" << json_escape(stats.session_id) << "\""
        << R"(,"total":)" << stats.total_executions
        << R"(,"successful":)" << stats.successful_executions
        << R"(,"success_rate":)" << stats.success_rate()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
    events_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace codelab

/**
 * @file wire_codec.cpp
 * @brief nlohmann/json encoders and decoders for the gateway.
 * @author Dimitris Kafetzis
 */

#include "gateway/wire_codec.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdio>
#include <ctime>

namespace codelab {

using json = nlohmann::json;

namespace {

Result<json> parse_object(std::string_view body) {
    json document = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (document.is_discarded()) {
        return Error{ErrorCode::Parse, "Request body is not valid JSON"};
    }
    if (!document.is_object()) {
        return Error{ErrorCode::InvalidArgument, "Request body must be a JSON object"};
    }
    return document;
}

Result<std::string> required_string(const json& document, const char* field) {
    auto it = document.find(field);
    if (it == document.end() || it->is_null()) {
        return Error{ErrorCode::InvalidArgument, std::string("Missing field '") + field + "'"};
    }
    if (!it->is_string()) {
        return Error{ErrorCode::InvalidArgument, std::string("Field '") + field + "' must be a string"};
    }
    return it->get<std::string>();
}

/// Absent or null yields the fallback; any other non-string is an error.
Result<std::string> optional_string(const json& document, const char* field,
                                    std::string fallback = {}) {
    auto it = document.find(field);
    if (it == document.end() || it->is_null()) return fallback;
    if (!it->is_string()) {
        return Error{ErrorCode::InvalidArgument, std::string("Field '") + field + "' must be a string"};
    }
    return it->get<std::string>();
}

std::string iso8601(Timestamp when) {
    auto t = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
    ::gmtime_r(&t, &utc);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec);
    return buf;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Decoding
// ─────────────────────────────────────────────

Result<ExecutionRequest> decode_execution_request(std::string_view body) {
    auto document = parse_object(body);
    if (!document) return document.error();

    auto code = required_string(*document, "code");
    if (!code) return code.error();
    auto language = required_string(*document, "language");
    if (!language) return language.error();
    auto user = optional_string(*document, "user_id");
    if (!user) return user.error();
    auto stdin_data = optional_string(*document, "stdin");
    if (!stdin_data) return stdin_data.error();

    ExecutionRequest request;
    request.code = std::move(*code);
    request.language = std::move(*language);
    request.user_id = std::move(*user);
    request.stdin_data = std::move(*stdin_data);

    if (auto it = document->find("task_id"); it != document->end() && !it->is_null()) {
        if (it->is_string()) {
            request.task_id = it->get<std::string>();
        } else if (it->is_number_integer()) {
            request.task_id = std::to_string(it->get<int64_t>());
        } else {
            return Error{ErrorCode::InvalidArgument, "Field 'task_id' must be a string"};
        }
    }
    return request;
}

Result<TranslationRequest> decode_translation_request(std::string_view body) {
    auto document = parse_object(body);
    if (!document) return document.error();

    auto code = required_string(*document, "code");
    if (!code) return code.error();
    auto direction_id = optional_string(*document, "direction",
                                        std::string(to_string(TranslationDirection::TeachingToHost)));
    if (!direction_id) return direction_id.error();

    auto direction = parse_direction(*direction_id);
    if (!direction) {
        return Error{ErrorCode::InvalidArgument, "Unknown translation direction: " + *direction_id};
    }
    return TranslationRequest{std::move(*code), *direction};
}

Result<ValidationRequest> decode_validation_request(std::string_view body) {
    auto document = parse_object(body);
    if (!document) return document.error();

    auto code = required_string(*document, "code");
    if (!code) return code.error();
    auto dialect_id = optional_string(*document, "dialect",
                                      std::string(to_string(Dialect::Teaching)));
    if (!dialect_id) return dialect_id.error();

    auto dialect = parse_dialect(*dialect_id);
    if (!dialect) {
        return Error{ErrorCode::InvalidArgument, "Unknown dialect: " + *dialect_id};
    }
    return ValidationRequest{std::move(*code), *dialect};
}

// ─────────────────────────────────────────────
// Encoding
// ─────────────────────────────────────────────

std::string encode_execution_result(const ExecutionResult& result) {
    json out = {
        {"success", result.succeeded()},
        {"output", result.stdout_data},
        {"error", nullptr},
        {"execution_time", result.execution_time_seconds},
        {"memory_used", result.memory_used_bytes},
        {"status", std::string(to_string(result.status))},
        {"exit_code", result.exit_code},
    };
    if (result.stderr_data) out["error"] = *result.stderr_data;
    // Child output is arbitrary bytes; invalid UTF-8 is replaced, not thrown.
    return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string encode_translation_result(const TranslationResult& result) {
    json out = {
        {"success", result.success},
        {"translated_code", result.translated_code},
        {"source_language", result.source_label},
        {"target_language", result.target_label},
        {"errors", result.errors},
        {"warnings", result.warnings},
        {"metadata", {
            {"original_length", result.metadata.original_length},
            {"translated_length", result.metadata.translated_length},
            {"direction", std::string(to_string(result.metadata.direction))},
            {"timestamp", result.metadata.timestamp},
        }},
    };
    return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string encode_validation(const std::vector<std::string>& errors) {
    json out = {
        {"valid", errors.empty()},
        {"errors", errors},
    };
    return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string encode_session(const SessionStats& stats) {
    json counts = json::object();
    for (const auto& [language, count] : stats.language_counts) {
        counts[language] = count;
    }
    json out = {
        {"session_id", stats.session_id},
        {"user_id", stats.user_id},
        {"started_at", iso8601(stats.started_at)},
        {"total_executions", stats.total_executions},
        {"successful_executions", stats.successful_executions},
        {"failed_executions", stats.failed_executions},
        {"success_rate", stats.success_rate()},
        {"total_execution_time", stats.total_execution_time_seconds},
        {"language_counts", std::move(counts)},
    };
    return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string encode_health(const std::vector<Language>& languages) {
    json ids = json::array();
    for (auto language : languages) ids.push_back(std::string(to_string(language)));
    json out = {
        {"status", "ok"},
        {"languages", std::move(ids)},
    };
    return out.dump();
}

std::string encode_error(std::string_view message) {
    json out = {{"error", std::string(message)}};
    return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string encode_execution_failure(std::string_view message) {
    return encode_execution_result(make_rejection(ExecutionStatus::Failure, std::string(message)));
}

}  // namespace codelab

/**
 * @file wire_codec.hpp
 * @brief JSON encoding of gateway requests and responses (nlohmann/json).
 * @author Dimitris Kafetzis
 *
 * Decoders return Result<T> with ErrorCode::Parse for malformed JSON and
 * ErrorCode::InvalidArgument for well-formed JSON with missing or mistyped
 * fields. Encoders never fail.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace codelab {

struct ValidationRequest {
    std::string code;
    Dialect dialect = Dialect::Teaching;
};

// ── Decoding ─────────────────────────────────
[[nodiscard]] Result<ExecutionRequest> decode_execution_request(std::string_view body);
[[nodiscard]] Result<TranslationRequest> decode_translation_request(std::string_view body);
[[nodiscard]] Result<ValidationRequest> decode_validation_request(std::string_view body);

// ── Encoding ─────────────────────────────────
[[nodiscard]] std::string encode_execution_result(const ExecutionResult& result);
[[nodiscard]] std::string encode_translation_result(const TranslationResult& result);
[[nodiscard]] std::string encode_validation(const std::vector<std::string>& errors);
[[nodiscard]] std::string encode_session(const SessionStats& stats);
[[nodiscard]] std::string encode_health(const std::vector<Language>& languages);
[[nodiscard]] std::string encode_error(std::string_view message);

/// Execution-shaped failure used when a request never reached the pipeline.
[[nodiscard]] std::string encode_execution_failure(std::string_view message);

}  // namespace codelab

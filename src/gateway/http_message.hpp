/**
 * @file http_message.hpp
 * @brief Minimal HTTP/1.1 request parsing and response serialization.
 * @author Dimitris Kafetzis
 *
 * One request per connection; bodies are delimited by Content-Length only
 * (chunked transfer encoding is refused).
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codelab {

struct HttpRequest {
    std::string method;
    std::string path;                               ///< Without the query string
    std::string query;
    std::map<std::string, std::string> headers;     ///< Names lower-cased
    std::string body;

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const;
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;

    [[nodiscard]] static HttpResponse json(int status, std::string body);
};

/**
 * @brief Why a request could not be parsed, with the status to answer.
 */
struct HttpParseError {
    int status = 400;
    std::string message;
};

/// Upper bound on the request line plus headers.
inline constexpr size_t kMaxHeaderBytes = 16 * 1024;

/**
 * @brief Try to parse a complete request from the bytes received so far.
 *
 * Returns std::nullopt while more bytes are needed. A declared body larger
 * than `max_body_bytes` fails with 413 as soon as the head is complete.
 */
[[nodiscard]] Result<std::optional<HttpRequest>, HttpParseError>
try_parse_request(std::string_view buffer, uint64_t max_body_bytes);

[[nodiscard]] std::string serialize_response(const HttpResponse& response);

/**
 * @brief Decode %XX escapes in a path segment.
 *
 * '+' is kept literally. Returns std::nullopt on a truncated or non-hex escape.
 */
[[nodiscard]] std::optional<std::string> percent_decode(std::string_view text);

[[nodiscard]] std::string_view reason_phrase(int status) noexcept;

}  // namespace codelab

/**
 * @file http_message.cpp
 * @brief HTTP/1.1 parsing and serialization.
 * @author Dimitris Kafetzis
 */

#include "gateway/http_message.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace codelab {

namespace {

constexpr std::string_view kHeadTerminator = "\r\n\r\n";

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

HttpParseError bad_request(std::string message) {
    return HttpParseError{400, std::move(message)};
}

}  // anonymous namespace

std::optional<std::string_view> HttpRequest::header(std::string_view name) const {
    auto it = headers.find(lower(name));
    if (it == headers.end()) return std::nullopt;
    return std::string_view(it->second);
}

HttpResponse HttpResponse::json(int status, std::string body) {
    HttpResponse response;
    response.status = status;
    response.body = std::move(body);
    return response;
}

Result<std::optional<HttpRequest>, HttpParseError>
try_parse_request(std::string_view buffer, uint64_t max_body_bytes) {
    using ParseResult = Result<std::optional<HttpRequest>, HttpParseError>;

    auto head_end = buffer.find(kHeadTerminator);
    if (head_end == std::string_view::npos) {
        if (buffer.size() > kMaxHeaderBytes) {
            return ParseResult(HttpParseError{431, "Request header fields too large"});
        }
        return ParseResult(std::optional<HttpRequest>{});
    }

    auto head = buffer.substr(0, head_end);
    HttpRequest request;

    // ── Request line ──────────────────────────
    auto line_end = head.find("\r\n");
    auto request_line = head.substr(0, line_end);
    auto sp1 = request_line.find(' ');
    auto sp2 = sp1 == std::string_view::npos ? sp1 : request_line.find(' ', sp1 + 1);
    if (sp1 == std::string_view::npos || sp2 == std::string_view::npos) {
        return ParseResult(bad_request("Malformed request line"));
    }
    request.method = std::string(request_line.substr(0, sp1));
    auto target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    auto version = request_line.substr(sp2 + 1);
    if (!version.starts_with("HTTP/1.")) {
        return ParseResult(HttpParseError{505, "HTTP version not supported"});
    }
    auto query_pos = target.find('?');
    request.path = std::string(target.substr(0, query_pos));
    if (query_pos != std::string_view::npos) request.query = std::string(target.substr(query_pos + 1));
    if (request.method.empty() || request.path.empty() || request.path.front() != '/') {
        if (!(request.method == "OPTIONS" && request.path == "*")) {
            return ParseResult(bad_request("Malformed request target"));
        }
    }

    // ── Headers ──────────────────────────────
    auto rest = line_end == std::string_view::npos ? std::string_view{} : head.substr(line_end + 2);
    while (!rest.empty()) {
        auto end = rest.find("\r\n");
        auto line = rest.substr(0, end);
        rest = end == std::string_view::npos ? std::string_view{} : rest.substr(end + 2);
        if (line.empty()) continue;

        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return ParseResult(bad_request("Malformed header line"));
        }
        request.headers[lower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
    }

    if (auto encoding = request.header("transfer-encoding"); encoding && lower(*encoding) != "identity") {
        return ParseResult(HttpParseError{411, "Chunked bodies are not supported; send Content-Length"});
    }

    // ── Body ─────────────────────────────────
    uint64_t content_length = 0;
    if (auto declared = request.header("content-length")) {
        auto [ptr, ec] = std::from_chars(declared->data(), declared->data() + declared->size(),
                                         content_length);
        if (ec != std::errc{} || ptr != declared->data() + declared->size()) {
            return ParseResult(bad_request("Invalid Content-Length"));
        }
    }
    if (content_length > max_body_bytes) {
        return ParseResult(HttpParseError{413, "Request body exceeds "
                                               + std::to_string(max_body_bytes) + " bytes"});
    }

    auto body_start = head_end + kHeadTerminator.size();
    if (buffer.size() - body_start < content_length) {
        return ParseResult(std::optional<HttpRequest>{});
    }
    request.body = std::string(buffer.substr(body_start, static_cast<size_t>(content_length)));
    return ParseResult(std::optional<HttpRequest>(std::move(request)));
}

std::string_view reason_phrase(int status) noexcept {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        case 505: return "HTTP Version Not Supported";
    }
    return "Unknown";
}

std::string serialize_response(const HttpResponse& response) {
    std::string out;
    out.reserve(response.body.size() + 256);
    out += "HTTP/1.1 " + std::to_string(response.status) + " "
         + std::string(reason_phrase(response.status)) + "\r\n";
    out += "Content-Type: " + response.content_type + "\r\n";
    out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
    out += "Connection: close\r\n";
    out += "Access-Control-Allow-Origin: *\r\n";
    for (const auto& [name, value] : response.headers) {
        out += name + ": " + value + "\r\n";
    }
    out += "\r\n";
    out += response.body;
    return out;
}

std::optional<std::string> percent_decode(std::string_view text) {
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            out += text[i];
            continue;
        }
        if (i + 2 >= text.size()) return std::nullopt;
        const int high = hex(text[i + 1]);
        const int low = hex(text[i + 2]);
        if (high < 0 || low < 0) return std::nullopt;
        out += static_cast<char>((high << 4) | low);
        i += 2;
    }
    return out;
}

}  // namespace codelab

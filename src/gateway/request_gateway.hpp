/**
 * @file request_gateway.hpp
 * @brief Routes HTTP requests onto the execution orchestrator.
 * @author Dimitris Kafetzis
 *
 * Routes:
 *   POST /execute          → submit()
 *   POST /translate        → translate()
 *   POST /validate         → validate_syntax()
 *   GET  /sessions/<user>  → session()
 *   GET  /health           → supported_languages()
 *   OPTIONS <any>          → CORS preflight
 *
 * Every execution outcome (including rejections) answers 200 with the
 * execution shape; only transport-level problems change the status code.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/logger.hpp"
#include "gateway/http_message.hpp"
#include "gateway/wire_codec.hpp"

#include <nlohmann/json.hpp>

#include <stop_token>
#include <string>
#include <string_view>

namespace codelab {

template <OrchestratorLike OrchestratorT>
class RequestGateway {
public:
    static constexpr std::string_view kSessionsPrefix = "/sessions/";

    RequestGateway(OrchestratorT& orchestrator, Logger& logger)
        : orchestrator_(orchestrator)
        , logger_(logger) {}

    /// Never throws; internal faults become 500 (or the execution shape on /execute).
    HttpResponse handle(const HttpRequest& request, std::stop_token stop = {});

private:
    HttpResponse handle_execute(const HttpRequest& request, std::stop_token stop);
    HttpResponse handle_translate(const HttpRequest& request);
    HttpResponse handle_validate(const HttpRequest& request);
    HttpResponse handle_session(std::string_view segment);
    HttpResponse handle_health();

    static HttpResponse preflight();
    static HttpResponse error(int status, std::string_view message) {
        return HttpResponse::json(status, encode_error(message));
    }
    static int status_for(const Error& err) noexcept {
        return err.code == ErrorCode::Parse || err.code == ErrorCode::InvalidArgument ? 400 : 500;
    }

    OrchestratorT& orchestrator_;
    Logger& logger_;
};

// ─────────────────────────────────────────────
// Template Implementation
// ─────────────────────────────────────────────

template <OrchestratorLike OrchestratorT>
HttpResponse RequestGateway<OrchestratorT>::handle(const HttpRequest& request, std::stop_token stop) {
    const auto& path = request.path;
    const auto& method = request.method;

    logger_.debug(method + " " + path);

    if (method == "OPTIONS") return preflight();

    try {
        if (path == "/execute") {
            if (method != "POST") return error(405, "Method not allowed");
            return handle_execute(request, std::move(stop));
        }
        if (path == "/translate") {
            if (method != "POST") return error(405, "Method not allowed");
            return handle_translate(request);
        }
        if (path == "/validate") {
            if (method != "POST") return error(405, "Method not allowed");
            return handle_validate(request);
        }
        if (path == "/health") {
            if (method != "GET") return error(405, "Method not allowed");
            return handle_health();
        }
        if (path.starts_with(kSessionsPrefix) && path.size() > kSessionsPrefix.size()) {
            if (method != "GET") return error(405, "Method not allowed");
            return handle_session(std::string_view(path).substr(kSessionsPrefix.size()));
        }
    } catch (const nlohmann::json::exception& e) {
        logger_.error(std::string("JSON failure on ") + path + ": " + e.what());
        return error(500, std::string("Internal server error: ") + e.what());
    } catch (const std::exception& e) {
        logger_.error(std::string("Handler failure on ") + path + ": " + e.what());
        if (path == "/execute") {
            return HttpResponse::json(500, encode_execution_failure(
                std::string("Internal server error: ") + e.what()));
        }
        return error(500, std::string("Internal server error: ") + e.what());
    }

    return error(404, "Not found: " + path);
}

template <OrchestratorLike OrchestratorT>
HttpResponse RequestGateway<OrchestratorT>::handle_execute(const HttpRequest& request,
                                                           std::stop_token stop) {
    auto decoded = decode_execution_request(request.body);
    if (!decoded) {
        return HttpResponse::json(status_for(decoded.error()),
                                  encode_execution_failure(decoded.error().message));
    }
    auto result = orchestrator_.submit(*decoded, std::move(stop));
    return HttpResponse::json(200, encode_execution_result(result));
}

template <OrchestratorLike OrchestratorT>
HttpResponse RequestGateway<OrchestratorT>::handle_translate(const HttpRequest& request) {
    auto decoded = decode_translation_request(request.body);
    if (!decoded) return error(status_for(decoded.error()), decoded.error().message);

    auto result = orchestrator_.translate(decoded->source_code, decoded->direction);
    return HttpResponse::json(200, encode_translation_result(result));
}

template <OrchestratorLike OrchestratorT>
HttpResponse RequestGateway<OrchestratorT>::handle_validate(const HttpRequest& request) {
    auto decoded = decode_validation_request(request.body);
    if (!decoded) return error(status_for(decoded.error()), decoded.error().message);

    auto errors = orchestrator_.validate_syntax(decoded->code, decoded->dialect);
    return HttpResponse::json(200, encode_validation(errors));
}

template <OrchestratorLike OrchestratorT>
HttpResponse RequestGateway<OrchestratorT>::handle_session(std::string_view segment) {
    auto user = percent_decode(segment);
    if (!user) return error(400, "Malformed user id: " + std::string(segment));
    auto stats = orchestrator_.session(*user);
    if (!stats) return error(404, "No session for user: " + *user);
    return HttpResponse::json(200, encode_session(*stats));
}

template <OrchestratorLike OrchestratorT>
HttpResponse RequestGateway<OrchestratorT>::handle_health() {
    return HttpResponse::json(200, encode_health(orchestrator_.supported_languages()));
}

template <OrchestratorLike OrchestratorT>
HttpResponse RequestGateway<OrchestratorT>::preflight() {
    HttpResponse response;
    response.status = 200;
    response.content_type = "text/plain";
    response.headers = {
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type"},
    };
    return response;
}

}  // namespace codelab

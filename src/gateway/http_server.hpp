/**
 * @file http_server.hpp
 * @brief Poll-based HTTP/1.1 listener dispatching onto a bounded ThreadPool.
 * @author Dimitris Kafetzis
 *
 * One thread accepts; each connection is read, handled and answered on a
 * pool worker. When the pool queue is full the accept thread answers 503
 * itself. Stopping the server cancels in-flight handlers through their
 * std::stop_token.
 */

#pragma once

#include "core/result.hpp"
#include "executor/thread_pool.hpp"
#include "gateway/http_message.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>
#include <thread>

namespace codelab {

class HttpServer {
public:
    static constexpr int DEFAULT_BACKLOG = 64;

    using Handler = std::function<HttpResponse(const HttpRequest&, std::stop_token)>;

    struct Options {
        std::string host = "0.0.0.0";
        uint16_t port = 8080;                   ///< 0 = ephemeral, see bound_port()
        uint32_t worker_threads = 0;
        uint32_t max_pending = 64;
        uint64_t max_request_bytes = 1048576;
        uint32_t io_timeout_ms = 10000;
    };

    explicit HttpServer(Options options);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    Result<void> listen();
    void serve(Handler handler);
    void stop();

    // ── State queries ────────────────────────
    [[nodiscard]] bool is_listening() const noexcept;
    [[nodiscard]] uint16_t bound_port() const noexcept { return bound_port_; }
    [[nodiscard]] uint64_t requests_served() const noexcept { return served_.load(); }
    [[nodiscard]] uint64_t requests_rejected() const noexcept { return rejected_.load(); }

private:
    void handle_connection(int fd, std::stop_token stop);
    HttpResponse dispatch(const HttpRequest& request, std::stop_token stop);
    static bool send_all(int fd, std::string_view data, uint32_t timeout_ms);

    Options options_;
    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    Handler handler_;
    ThreadPool pool_;
    std::jthread accept_thread_;
    std::atomic<uint64_t> served_{0};
    std::atomic<uint64_t> rejected_{0};
};

}  // namespace codelab

/**
 * @file http_server.cpp
 * @brief HttpServer implementation.
 * @author Dimitris Kafetzis
 */

#include "gateway/http_server.hpp"

#include "gateway/wire_codec.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <memory>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace codelab {

namespace {

constexpr size_t kReadChunk = 16 * 1024;
constexpr int kAcceptPollMs = 100;

void configure_socket(int fd) {
    int flag = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
}

/**
 * @brief Owns an accepted socket; shared between the accept thread and the
 * worker that ends up handling it.
 */
class Connection {
public:
    explicit Connection(int fd) : fd_(fd) {}
    ~Connection() {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
    }
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    [[nodiscard]] int fd() const noexcept { return fd_; }

private:
    int fd_;
};

HttpResponse error_response(int status, std::string_view message) {
    return HttpResponse::json(status, encode_error(message));
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

HttpServer::HttpServer(Options options)
    : options_(std::move(options))
    , pool_(options_.worker_threads, options_.max_pending) {}

HttpServer::~HttpServer() {
    stop();
}

// ─────────────────────────────────────────────
// Listening
// ─────────────────────────────────────────────

Result<void> HttpServer::listen() {
    if (server_fd_ >= 0) {
        return Error{ErrorCode::InvalidArgument, "Already listening"};
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(options_.port);
    if (options_.host.empty() || options_.host == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (::inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) != 1) {
        return Error{ErrorCode::InvalidArgument, "Invalid listen address: " + options_.host};
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        return Error{ErrorCode::Io, "Failed to create server socket: " + std::string(strerror(errno))};
    }

    int optval = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    if (::bind(server_fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string reason = strerror(errno);
        ::close(server_fd_);
        server_fd_ = -1;
        return Error{ErrorCode::Io, "Bind failed: " + reason};
    }

    if (::listen(server_fd_, DEFAULT_BACKLOG) < 0) {
        std::string reason = strerror(errno);
        ::close(server_fd_);
        server_fd_ = -1;
        return Error{ErrorCode::Io, "Listen failed: " + reason};
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = options_.port;
    }
    return Result<void>{};
}

void HttpServer::serve(Handler handler) {
    if (server_fd_ < 0) return;

    handler_ = std::move(handler);
    accept_thread_ = std::jthread([this](std::stop_token stop) {
        while (!stop.stop_requested()) {
            pollfd pfd{};
            pfd.fd = server_fd_;
            pfd.events = POLLIN;

            int ready = ::poll(&pfd, 1, kAcceptPollMs);
            if (ready <= 0) continue;

            int client_fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (client_fd < 0) continue;

            configure_socket(client_fd);
            auto connection = std::make_shared<Connection>(client_fd);

            auto accepted = pool_.try_submit_cancellable(
                [this, connection](std::stop_token worker_stop) {
                    handle_connection(connection->fd(), worker_stop);
                });
            if (!accepted) {
                ++rejected_;
                auto busy = serialize_response(error_response(503, "Server is busy, try again later"));
                send_all(connection->fd(), busy, options_.io_timeout_ms);
            }
        }
    });
}

void HttpServer::stop() {
    if (accept_thread_.joinable()) {
        accept_thread_.request_stop();
        accept_thread_.join();
    }
    pool_.shutdown();
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
}

bool HttpServer::is_listening() const noexcept {
    return server_fd_ >= 0;
}

// ─────────────────────────────────────────────
// Per-connection handling
// ─────────────────────────────────────────────

void HttpServer::handle_connection(int fd, std::stop_token stop) {
    std::string buffer;
    char chunk[kReadChunk];

    while (!stop.stop_requested()) {
        auto parsed = try_parse_request(buffer, options_.max_request_bytes);
        if (!parsed) {
            const auto& failure = parsed.error();
            send_all(fd, serialize_response(error_response(failure.status, failure.message)),
                     options_.io_timeout_ms);
            return;
        }
        if (parsed->has_value()) {
            auto response = dispatch(**parsed, stop);
            send_all(fd, serialize_response(response), options_.io_timeout_ms);
            ++served_;
            return;
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, static_cast<int>(options_.io_timeout_ms));
        if (ready <= 0) {
            send_all(fd, serialize_response(error_response(408, "Request timed out")),
                     options_.io_timeout_ms);
            return;
        }

        auto received = ::recv(fd, chunk, sizeof(chunk), 0);
        if (received < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
        if (received <= 0) return;  // Peer closed or error
        buffer.append(chunk, static_cast<size_t>(received));
    }
}

HttpResponse HttpServer::dispatch(const HttpRequest& request, std::stop_token stop) {
    try {
        return handler_(request, std::move(stop));
    } catch (const std::exception& e) {
        return error_response(500, std::string("Internal server error: ") + e.what());
    }
}

bool HttpServer::send_all(int fd, std::string_view data, uint32_t timeout_ms) {
    const char* ptr = data.data();
    size_t remaining = data.size();

    while (remaining > 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready <= 0) return false;

        auto sent = ::send(fd, ptr, remaining, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
            return false;
        }

        ptr += sent;
        remaining -= static_cast<size_t>(sent);
    }
    return true;
}

}  // namespace codelab

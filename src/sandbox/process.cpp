/**
 * @file process.cpp
 * @brief run_process implementation: fork/exec with poll-driven capture and killpg.
 * @author Dimitris Kafetzis
 */

#include "sandbox/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string_view>
#include <utility>

namespace codelab {

namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr std::string_view kDefaultPath = "/usr/local/bin:/usr/bin:/bin";
constexpr auto kDrainGrace = std::chrono::milliseconds(100);
constexpr int kPollSliceMs = 50;
constexpr size_t kReadChunk = 64 * 1024;

std::string errno_text(int err) {
    return std::string(std::strerror(err));
}

/**
 * @brief Owning file descriptor.
 */
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    void reset() noexcept {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

Result<Pipe> make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Error{ErrorCode::Io, "pipe2 failed: " + errno_text(errno)};
    }
    return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

/**
 * @brief Kills and reaps the child group if the normal path did not.
 */
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid) noexcept : pid_(pid) {}
    ~ChildGuard() {
        if (pid_ <= 0) return;
        ::killpg(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    }

    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    void release() noexcept { pid_ = -1; }

private:
    pid_t pid_;
};

/// True once the group leader has exited; the zombie is left for wait4.
bool leader_exited(pid_t pid) {
    siginfo_t info{};
    if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        return errno == ECHILD;
    }
    return info.si_pid == pid;
}

/**
 * @brief One captured output stream.
 */
struct Capture {
    UniqueFd fd;
    std::string* sink;
    bool* overflow;
    uint64_t limit;

    /// Read what is available; false once the stream hit EOF or failed.
    bool pump() {
        std::array<char, kReadChunk> buf{};
        while (true) {
            auto n = ::read(fd.get(), buf.data(), buf.size());
            if (n > 0) {
                auto room = limit > sink->size() ? limit - sink->size() : 0;
                auto take = std::min<uint64_t>(room, static_cast<uint64_t>(n));
                sink->append(buf.data(), static_cast<size_t>(take));
                if (take < static_cast<uint64_t>(n)) *overflow = true;
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
            fd.reset();
            return false;
        }
    }
};

/**
 * @brief Feeds stdin_data to the child without blocking.
 */
struct StdinFeed {
    UniqueFd fd;
    std::string_view pending;

    void pump() {
        while (fd.valid() && !pending.empty()) {
            auto n = ::write(fd.get(), pending.data(), pending.size());
            if (n > 0) {
                pending.remove_prefix(static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
            fd.reset();     // EPIPE: the child stopped reading
            return;
        }
        fd.reset();
    }
};

/**
 * @brief Poll every open stream once, waiting at most timeout_ms.
 */
void poll_streams(Capture& out, Capture& err, StdinFeed& in, int timeout_ms) {
    std::array<pollfd, 3> pfds{};
    nfds_t count = 0;
    int out_idx = -1, err_idx = -1, in_idx = -1;

    if (out.fd.valid()) { out_idx = static_cast<int>(count); pfds[count++] = {out.fd.get(), POLLIN, 0}; }
    if (err.fd.valid()) { err_idx = static_cast<int>(count); pfds[count++] = {err.fd.get(), POLLIN, 0}; }
    if (in.fd.valid())  { in_idx = static_cast<int>(count);  pfds[count++] = {in.fd.get(), POLLOUT, 0}; }

    int ready = ::poll(count > 0 ? pfds.data() : nullptr, count, timeout_ms);
    if (ready <= 0) return;

    if (out_idx >= 0 && pfds[static_cast<size_t>(out_idx)].revents != 0) out.pump();
    if (err_idx >= 0 && pfds[static_cast<size_t>(err_idx)].revents != 0) err.pump();
    if (in_idx >= 0 && pfds[static_cast<size_t>(in_idx)].revents != 0) in.pump();
}

/// Read what is left in the pipes for a short grace period.
void drain(Capture& out, Capture& err, StdinFeed& in) {
    in.fd.reset();
    auto until = SteadyClock::now() + kDrainGrace;
    while ((out.fd.valid() || err.fd.valid()) && SteadyClock::now() < until) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - SteadyClock::now());
        poll_streams(out, err, in, static_cast<int>(std::max<int64_t>(left.count(), 1)));
    }
}

std::string child_path_env() {
    const char* path = std::getenv("PATH");
    return "PATH=" + std::string(path && *path ? path : kDefaultPath);
}

void set_limit(int resource, rlim_t soft, rlim_t hard) {
    rlimit lim{soft, hard};
    ::setrlimit(resource, &lim);
}

/**
 * @brief Runs in the forked child; only async-signal-safe calls.
 */
[[noreturn]] void exec_child(const ProcessSpec& spec, const char* exe, char* const* argv,
                             char* const* envp, int in_fd, int out_fd, int err_fd,
                             int report_fd) {
    ::setpgid(0, 0);
    ::signal(SIGPIPE, SIG_DFL);

    if (::dup2(in_fd, STDIN_FILENO) < 0 || ::dup2(out_fd, STDOUT_FILENO) < 0
        || ::dup2(err_fd, STDERR_FILENO) < 0) {
        int err = errno;
        (void)!::write(report_fd, &err, sizeof(err));
        ::_exit(127);
    }
    if (!spec.working_dir.empty() && ::chdir(spec.working_dir.c_str()) != 0) {
        int err = errno;
        (void)!::write(report_fd, &err, sizeof(err));
        ::_exit(127);
    }

    set_limit(RLIMIT_CORE, 0, 0);
    set_limit(RLIMIT_FSIZE, spec.max_file_bytes, spec.max_file_bytes);
    if (spec.address_space_bytes) {
        set_limit(RLIMIT_AS, *spec.address_space_bytes, *spec.address_space_bytes);
    }
    if (spec.cpu_seconds) {
        set_limit(RLIMIT_CPU, *spec.cpu_seconds, *spec.cpu_seconds + 1);
    }

    ::execve(exe, argv, envp);
    int err = errno;
    (void)!::write(report_fd, &err, sizeof(err));
    ::_exit(127);
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Executable Lookup
// ─────────────────────────────────────────────

std::optional<std::filesystem::path> find_executable(const std::string& name) {
    if (name.empty()) return std::nullopt;

    auto is_executable = [](const std::filesystem::path& p) {
        struct stat st{};
        return ::stat(p.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(p.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        if (is_executable(name)) return std::filesystem::path(name);
        return std::nullopt;
    }

    const char* env_path = std::getenv("PATH");
    std::string_view search = env_path && *env_path ? std::string_view(env_path) : kDefaultPath;
    while (!search.empty()) {
        auto sep = search.find(':');
        auto dir = search.substr(0, sep);
        search = sep == std::string_view::npos ? std::string_view{} : search.substr(sep + 1);
        if (dir.empty()) continue;
        auto candidate = std::filesystem::path(dir) / name;
        if (is_executable(candidate)) return candidate;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────
// run_process
// ─────────────────────────────────────────────

Result<ProcessOutcome> run_process(const ProcessSpec& spec, std::stop_token stop) {
    if (spec.argv.empty()) {
        return Error{ErrorCode::InvalidArgument, "empty argv"};
    }
    ignore_sigpipe_once();

    auto exe = find_executable(spec.argv.front());
    if (!exe) {
        return Error{ErrorCode::SpawnFailed, spec.argv.front() + ": command not found"};
    }

    // Everything the child touches is built before fork.
    const std::string exe_str = exe->string();
    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    const std::string home = spec.working_dir.empty() ? std::string("/tmp") : spec.working_dir.string();
    std::vector<std::string> env_storage{
        child_path_env(),
        "HOME=" + home,
        "TMPDIR=" + home,
        "LANG=C.UTF-8",
        "PYTHONDONTWRITEBYTECODE=1",
        "PYTHONUNBUFFERED=1",
    };
    std::vector<char*> envp;
    for (auto& entry : env_storage) envp.push_back(entry.data());
    envp.push_back(nullptr);

    auto in_pipe = make_pipe();
    if (!in_pipe) return in_pipe.error();
    auto out_pipe = make_pipe();
    if (!out_pipe) return out_pipe.error();
    auto err_pipe = make_pipe();
    if (!err_pipe) return err_pipe.error();
    auto report_pipe = make_pipe();
    if (!report_pipe) return report_pipe.error();

    const auto started = SteadyClock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        return Error{ErrorCode::Io, "fork failed: " + errno_text(errno)};
    }
    if (pid == 0) {
        exec_child(spec, exe_str.c_str(), argv.data(), envp.data(),
                   in_pipe->read_end.get(), out_pipe->write_end.get(),
                   err_pipe->write_end.get(), report_pipe->write_end.get());
    }

    ::setpgid(pid, pid);
    ChildGuard guard(pid);

    in_pipe->read_end.reset();
    out_pipe->write_end.reset();
    err_pipe->write_end.reset();
    report_pipe->write_end.reset();

    // The report pipe closes on a successful exec; a payload means exec failed.
    int exec_errno = 0;
    ssize_t got;
    do {
        got = ::read(report_pipe->read_end.get(), &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        return Error{ErrorCode::SpawnFailed,
                     "failed to start " + spec.argv.front() + ": " + errno_text(exec_errno)};
    }

    ProcessOutcome outcome;
    Capture out{std::move(out_pipe->read_end), &outcome.stdout_data,
                &outcome.stdout_overflow, spec.capture_limit_bytes};
    Capture err{std::move(err_pipe->read_end), &outcome.stderr_data,
                &outcome.stderr_overflow, spec.capture_limit_bytes};
    StdinFeed in{std::move(in_pipe->write_end), spec.stdin_data};

    set_nonblocking(out.fd.get());
    set_nonblocking(err.fd.get());
    set_nonblocking(in.fd.get());
    in.pump();

    const auto deadline = started + spec.timeout;
    while (true) {
        if (stop.stop_requested()) {
            outcome.cancelled = true;
            break;
        }
        auto now = SteadyClock::now();
        if (now >= deadline) {
            outcome.timed_out = true;
            break;
        }
        if (leader_exited(pid)) break;

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int slice = static_cast<int>(std::clamp<int64_t>(left.count(), 1, kPollSliceMs));
        poll_streams(out, err, in, slice);
    }

    // Descendants die with the group before the leader is reaped.
    ::killpg(pid, SIGKILL);
    drain(out, err, in);

    int status = 0;
    rusage usage{};
    pid_t reaped;
    do {
        reaped = ::wait4(pid, &status, 0, &usage);
    } while (reaped < 0 && errno == EINTR);
    guard.release();

    outcome.wall_time = std::chrono::duration_cast<std::chrono::microseconds>(
        SteadyClock::now() - started);

    if (reaped == pid) {
        if (WIFEXITED(status)) {
            outcome.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            outcome.term_signal = WTERMSIG(status);
            outcome.exit_code = 128 + outcome.term_signal;
        }
        outcome.peak_rss_bytes = static_cast<uint64_t>(usage.ru_maxrss) * 1024;
    } else {
        outcome.exit_code = -1;
    }

    return outcome;
}

}  // namespace codelab

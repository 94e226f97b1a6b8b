/**
 * @file thread_pool.hpp
 * @brief std::jthread-based thread pool with cooperative cancellation.
 * @author Dimitris Kafetzis
 *
 * Request handlers run here. The queue can be bounded so that an overloaded
 * daemon refuses new work (try_submit*) instead of queueing without limit.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace codelab {

/**
 * @brief Thread pool using std::jthread for automatic join and stop_token support.
 */
class ThreadPool {
public:
    /// @param max_pending  Queue bound for try_submit*; 0 = unbounded.
    explicit ThreadPool(size_t num_threads = 0, size_t max_pending = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Submit a callable that accepts a stop_token.
    template <std::invocable<std::stop_token> F>
    std::future<std::invoke_result_t<F, std::stop_token>> submit_cancellable(F&& func);

    /// Like submit_cancellable, but refuses when the queue is full or stopping.
    template <std::invocable<std::stop_token> F>
    std::optional<std::future<std::invoke_result_t<F, std::stop_token>>> try_submit_cancellable(F&& func);

    /// Stop accepting work, signal running tasks and join the workers.
    void shutdown();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;
    [[nodiscard]] size_t max_pending() const noexcept { return max_pending_; }

private:
    void worker_loop(std::stop_token stop);

    template <typename F>
    static std::function<void(std::stop_token)> wrap_cancellable(
        F&& func, std::shared_ptr<std::promise<std::invoke_result_t<F, std::stop_token>>> promise);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void(std::stop_token)>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
    size_t max_pending_;
    bool accepting_ = true;                 ///< Guarded by queue_mutex_
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push([p = std::move(promise), f = std::forward<F>(func)](std::stop_token) mutable {
            try {
                if constexpr (std::is_void_v<ReturnType>) {
                    f();
                    p->set_value();
                } else {
                    p->set_value(f());
                }
            } catch (...) {
                p->set_exception(std::current_exception());
            }
        });
    }
    queue_cv_.notify_one();
    return future;
}

template <typename F>
std::function<void(std::stop_token)> ThreadPool::wrap_cancellable(
    F&& func, std::shared_ptr<std::promise<std::invoke_result_t<F, std::stop_token>>> promise) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    return [p = std::move(promise), f = std::forward<F>(func)](std::stop_token stop) mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f(stop);
                p->set_value();
            } else {
                p->set_value(f(stop));
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    };
}

template <std::invocable<std::stop_token> F>
std::future<std::invoke_result_t<F, std::stop_token>> ThreadPool::submit_cancellable(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push(wrap_cancellable(std::forward<F>(func), std::move(promise)));
    }
    queue_cv_.notify_one();
    return future;
}

template <std::invocable<std::stop_token> F>
std::optional<std::future<std::invoke_result_t<F, std::stop_token>>>
ThreadPool::try_submit_cancellable(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        if (!accepting_) return std::nullopt;
        if (max_pending_ > 0 && task_queue_.size() >= max_pending_) return std::nullopt;
        task_queue_.push(wrap_cancellable(std::forward<F>(func), std::move(promise)));
    }
    queue_cv_.notify_one();
    return future;
}

}  // namespace codelab

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace rainbow {

/**
 * @brief Fixed-size worker pool used for parallel packet synthesis
 */
class ThreadPool {
public:
    /// 0 selects hardware_concurrency() (at least one worker).
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Queue a task; the future carries its result or exception.
    template <class F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>>;

    /**
     * @brief Run fn(0) .. fn(count - 1) on the pool and wait for all of them.
     *
     * Every task is awaited even when one fails; the first exception (by
     * index) is rethrown afterwards.
     */
    template <class F>
    void run_indexed(size_t count, F fn);

    /// Stop accepting work, drain the queue, join workers.
    void shutdown();

    size_t pending_tasks() const;
    size_t active_threads() const noexcept { return active_.load(); }
    size_t total_threads() const noexcept { return workers_.size(); }
    bool is_running() const noexcept { return !stop_.load(); }

private:
    void worker_loop();

    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex                queue_mutex_;
    std::condition_variable           condition_;
    std::atomic<bool>                 stop_{false};
    std::atomic<size_t>               active_{0};
};

template <class F>
auto ThreadPool::submit(F&& f) -> std::future<std::invoke_result_t<F>> {
    using R = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    std::future<R> result = task->get_future();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("submit on stopped ThreadPool");
        }
        tasks_.emplace([task]() { (*task)(); });
    }
    condition_.notify_one();
    return result;
}

template <class F>
void ThreadPool::run_indexed(size_t count, F fn) {
    std::vector<std::future<void>> pending;
    pending.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        pending.push_back(submit([&fn, i]() { fn(i); }));
    }
    std::exception_ptr first;
    for (auto& f : pending) {
        try {
            f.get();
        } catch (...) {
            if (!first) first = std::current_exception();
        }
    }
    if (first) std::rethrow_exception(first);
}

} // namespace rainbow

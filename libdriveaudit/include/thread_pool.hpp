/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool running the per-file extraction tasks.
 */

#ifndef DRIVEAUDIT_THREAD_POOL_HPP
#define DRIVEAUDIT_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

namespace driveaudit {

/**
 * @brief A fixed-size thread pool built on std::jthread.
 *
 * @details Tasks are callables taking a `std::stop_token`. A task's result,
 * or the exception it threw, is delivered through the returned future.
 * request_stop() drops tasks that have not started and signals the
 * stop_token of the running ones; it never interrupts a running task.
 */
class ThreadPool {
public:
    /**
     * @param threads Number of workers; 0 means one.
     */
    explicit ThreadPool(unsigned threads);

    /// Requests stop and joins every worker.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a task.
     * @throws std::runtime_error if the pool has been stopped.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(std::forward<F>(f));
        auto future = task->get_future();
        {
            std::lock_guard lock(mtx_);
            if (stopped_) throw std::runtime_error("enqueue on stopped ThreadPool");
            ++pending_;
            tasks_.emplace([task](const std::stop_token& st) { (*task)(st); });
        }
        work_cv_.notify_one();
        return future;
    }

    /// Block until every queued or running task has finished or been dropped.
    void wait_idle();

    /// Drop queued tasks and signal running ones through their stop_token.
    void request_stop();

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    void worker_loop(const std::stop_token& st);

    std::mutex mtx_;                        ///< Protects tasks_, stopped_ and pending_
    std::condition_variable_any work_cv_;   ///< Wakes workers on new tasks or stop
    std::condition_variable idle_cv_;       ///< Wakes wait_idle() when pending_ reaches zero
    std::queue<std::function<void(const std::stop_token&)>> tasks_;
    bool stopped_{false};
    std::size_t pending_{0};                ///< Tasks queued or running
    std::vector<std::jthread> workers_;
};

} // namespace driveaudit

#endif // DRIVEAUDIT_THREAD_POOL_HPP

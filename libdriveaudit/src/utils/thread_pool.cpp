#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"

namespace driveaudit {

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) { worker_loop(st); });
    }
}

ThreadPool::~ThreadPool() {
    request_stop();
    // jthread joins on destruction
}

void ThreadPool::worker_loop(const std::stop_token& st) {
    for (;;) {
        std::function<void(const std::stop_token&)> task;
        {
            std::unique_lock lock(mtx_);
            work_cv_.wait(lock, st, [this] { return stopped_ || !tasks_.empty(); });
            if (st.stop_requested() || (stopped_ && tasks_.empty())) return;
            if (tasks_.empty()) continue;
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        struct PendingGuard {
            std::size_t& pending;
            std::mutex& mtx;
            std::condition_variable& cv;
            ~PendingGuard() {
                std::lock_guard lock(mtx);
                if (pending > 0) --pending;
                cv.notify_all();
            }
        } guard{pending_, mtx_, idle_cv_};

        try {
            task(st);
        } catch (const std::exception& e) {
            // packaged_task stores task exceptions; this only sees failures of the wrapper itself
            Logger::log(LogLevel::Error, std::string("Unhandled exception in thread pool: ") + e.what(), "ThreadPool");
        }
    }
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(mtx_);
    idle_cv_.wait(lock, [this] { return pending_ == 0 && tasks_.empty(); });
}

void ThreadPool::request_stop() {
    {
        std::lock_guard lock(mtx_);
        stopped_ = true;
        while (!tasks_.empty()) {
            tasks_.pop();
            if (pending_ > 0) --pending_;
        }
    }
    idle_cv_.notify_all();
    work_cv_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
}

} // namespace driveaudit

#pragma once

/** \file thread_pool.hpp
 *  \brief Fixed-size FIFO thread pool for concurrent part uploads.
 *
 * A single centralized task queue guarded by one mutex. Workers drain the
 * queue on shutdown, so every accepted task runs before the destructor returns.
 */

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#if defined(__linux__)
#include <pthread.h>
#endif

#include "tessera/upload/executor.hpp"

namespace tessera::upload {

class ThreadPool final : public Executor {
public:
    /** \brief Construct thread pool with specified number of workers.
     *
     * \param num_threads Number of worker threads (0 = hardware concurrency / 2)
     */
    explicit ThreadPool(std::size_t num_threads = 0)
        : stop_(false) {
        if (num_threads == 0) {
            num_threads = std::max(1u, std::thread::hardware_concurrency() / 2);
        }
        workers_.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~ThreadPool() override {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        cv_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    auto execute(std::function<void()> task) -> std::expected<void, core::error> override {
        if (!enqueue(std::move(task))) {
            return core::make_error(core::error_code::unavailable,
                                    "thread pool is stopped", "upload.thread_pool");
        }
        return {};
    }

    /** \brief Submit task to thread pool.
     *
     * \param task Function to execute
     * \return Future for task result
     * \throws std::runtime_error when the pool is stopping
     */
    template<typename Func, typename... Args>
    auto submit(Func&& func, Args&&... args)
        -> std::future<decltype(func(args...))> {
        using return_type = decltype(func(args...));

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<Func>(func), std::forward<Args>(args)...)
        );

        auto future = task->get_future();
        if (!enqueue([task] { (*task)(); })) {
            throw std::runtime_error("Thread pool is stopped");
        }
        return future;
    }

    /** \brief Get number of worker threads. */
    [[nodiscard]] auto num_threads() const noexcept -> std::size_t {
        return workers_.size();
    }

    /** \brief Request cooperative stop. New submissions fail; workers exit when the queue drains. */
    auto request_stop() noexcept -> void {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_.store(true, std::memory_order_relaxed);
        }
        cv_.notify_all();
    }

    /** \brief Whether a stop was requested. */
    [[nodiscard]] auto stopping() const noexcept -> bool { return stop_.load(std::memory_order_relaxed); }

    /** \brief Wait until every accepted task has finished executing. */
    auto wait_all() -> void {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        cv_.wait(lock, [this] { return pending_.load(std::memory_order_relaxed) == 0; });
    }

private:
    auto enqueue(std::function<void()> task) -> bool {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                return false;
            }
            // pending_ counts queued and running tasks so wait_all() waits for completion
            pending_.fetch_add(1, std::memory_order_relaxed);
            tasks_.emplace_back([this, task = std::move(task)] {
                task();
                auto rem = pending_.fetch_sub(1, std::memory_order_relaxed) - 1;
                if (rem == 0) {
                    std::unique_lock<std::mutex> lk(queue_mutex_);
                    cv_.notify_all();
                }
            });
        }
        cv_.notify_one();
        return true;
    }

    auto worker_loop() -> void {
        #if defined(__linux__)
          pthread_setname_np(pthread_self(), "tessera-upload");
        #endif
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

                if (stop_ && tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::atomic<std::size_t> pending_{0};
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stop_;
};

} // namespace tessera::upload

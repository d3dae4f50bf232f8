#pragma once

/** \file thread_pool.hpp
 *  \brief Fixed-size worker pool with a centralized FIFO task queue.
 *
 * Destruction drains the queue: every submitted task runs before the workers join.
 */

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace bloomdb::server {

class ThreadPool {
public:
    /** \brief Construct thread pool with specified number of workers.
     *
     * \param num_threads Number of worker threads (0 = hardware concurrency)
     */
    explicit ThreadPool(std::size_t num_threads = 0) {
        if (num_threads == 0) {
            num_threads = std::max(1u, std::thread::hardware_concurrency());
        }
        workers_.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) worker.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /** \brief Submit task to thread pool.
     *
     * \return Future for task result
     * \throws std::runtime_error if the pool is stopping
     */
    template<typename Func>
    auto submit(Func&& func) -> std::future<decltype(func())> {
        using return_type = decltype(func());
        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<Func>(func));
        auto future = task->get_future();
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("Thread pool is stopped");
            }
            tasks_.emplace_back([task] { (*task)(); });
        }
        cv_.notify_one();
        return future;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return workers_.size(); }

private:
    void worker_loop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) return;
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool stop_{false};
};

} // namespace bloomdb::server

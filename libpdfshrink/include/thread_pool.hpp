//
// Fixed-size worker pool for the per-image decode/encode work.
//

/**
 * @file thread_pool.hpp
 * @brief Defines the worker pool used by PdfCompressor.
 *
 * Decoding and lossy encoding dominate run time and are independent
 * across images, so each image becomes one task. Document mutation is
 * never done on a worker.
 */

#ifndef PDFSHRINK_THREAD_POOL_HPP
#define PDFSHRINK_THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

/**
 * @brief A fixed-size thread pool built on std::jthread.
 *
 * @details Tasks receive a std::stop_token. request_stop() discards tasks
 * that have not started yet (their futures report broken_promise) and
 * signals running ones; running tasks are never interrupted forcibly.
 */
class ThreadPool {
public:
    /**
     * @brief Starts the worker threads.
     * @param threads Number of workers; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency() / 2);

    /**
     * @brief Stops accepting work; jthreads join on destruction.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a task that accepts a std::stop_token.
     * @return A future for the task result.
     * @throws std::runtime_error if the pool was stopped.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        {
            std::unique_lock lock(queue_mutex_);
            if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool");
            tasks_.emplace([task](std::stop_token st) { (*task)(st); });
        }
        condition_.notify_one();
        return task->get_future();
    }

    /**
     * @brief Drops queued tasks and signals the workers to exit.
     */
    void request_stop();

    /// @return Number of worker threads.
    [[nodiscard]] size_t size() const noexcept { return workers_.size(); }

private:
    std::mutex queue_mutex_;                ///< Protects tasks_ and stop_
    std::condition_variable_any condition_; ///< Wakes workers on new tasks or stop
    std::queue<std::function<void(std::stop_token)>> tasks_;
    bool stop_{false};
    std::vector<std::jthread> workers_;
};

#endif // PDFSHRINK_THREAD_POOL_HPP

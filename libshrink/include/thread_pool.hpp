/**
 * @file thread_pool.hpp
 * @brief Fixed-size thread pool used by BatchDriver.
 */

#ifndef SHRINK_THREAD_POOL_HPP
#define SHRINK_THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace shrink {

/**
 * @brief A fixed-size pool of std::jthread workers.
 *
 * @details Tasks receive the worker's std::stop_token so they can notice a
 * stop request before starting expensive work. request_stop() drops every
 * queued task: the futures of dropped tasks report
 * std::future_errc::broken_promise.
 */
class ThreadPool {
public:
    /**
     * @param threads Number of workers; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads);

    /// Stops the workers; jthread joins them.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a callable taking a std::stop_token.
     * @return Future for the callable's result.
     * @throws std::runtime_error if the pool has been stopped.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        auto future = task->get_future();
        {
            std::unique_lock lock(queue_mutex_);
            if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool");
            tasks_.emplace([task](std::stop_token st) { (*task)(std::move(st)); });
        }
        condition_.notify_one();
        return future;
    }

    /**
     * @brief Drop queued tasks and ask running ones to stop.
     *
     * Running tasks are not interrupted; they see the request through
     * their stop_token.
     */
    void request_stop();

    [[nodiscard]] unsigned size() const noexcept { return static_cast<unsigned>(workers_.size()); }

private:
    std::mutex queue_mutex_;                ///< Protects tasks_ and stop_
    std::condition_variable_any condition_; ///< Signals new tasks or a stop
    std::queue<std::function<void(std::stop_token)>> tasks_;
    bool stop_{false};
    std::vector<std::jthread> workers_;
};

} // namespace shrink

#endif // SHRINK_THREAD_POOL_HPP

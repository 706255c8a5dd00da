#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"

namespace shrink {

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) {
            for (;;) {
                std::function<void(std::stop_token)> task;
                {
                    std::unique_lock lock(queue_mutex_);
                    condition_.wait(lock, st, [this] {
                        return stop_ || !tasks_.empty();
                    });
                    if ((stop_ && tasks_.empty()) || st.stop_requested())
                        return;
                    if (tasks_.empty())
                        continue;
                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                try {
                    task(st);
                } catch (const std::exception& e) {
                    Logger::log(LogLevel::Error, std::string("Unhandled exception in thread pool: ") + e.what(),
                                "ThreadPool");
                }
            }
        });
    }
}

void ThreadPool::request_stop() {
    {
        std::unique_lock lock(queue_mutex_);
        stop_ = true;
        std::queue<std::function<void(std::stop_token)>> dropped;
        tasks_.swap(dropped);
    }
    condition_.notify_all();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();
}

} // namespace shrink

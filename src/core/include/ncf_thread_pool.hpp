#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace ncf {

/**
 * @brief Fixed-size worker pool for fire-and-forget jobs
 *
 * Used by HttpServer so API handlers (which may sweep the subnet for
 * seconds) never run on the libwebsockets service thread.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads, std::string name = "pool");
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Queue @p task; false once shutdown() has begun
    bool post(std::function<void()> task);

    /// Drain queued tasks, then join the workers
    void shutdown();

private:
    void worker_loop();

    std::string                           name_;
    std::vector<std::thread>              workers_;
    std::queue<std::function<void()>>     tasks_;
    mutable std::mutex                    queue_mutex_;
    std::condition_variable               condition_;
    std::atomic<bool>                     stop_{false};
};

} // namespace ncf

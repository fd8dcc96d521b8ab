#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace Mtree {

/**
 * @brief Fixed-size FIFO worker pool.
 *
 * Exceptions thrown by a task are stored in the task's future. The destructor
 * runs every task still queued before joining the workers.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t thread_count);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>>
    {
        using return_type = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
        std::future<return_type> result = task->get_future();

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stopping_) {
                throw std::runtime_error("Cannot submit to a stopped ThreadPool");
            }
            tasks_.emplace([task]() { (*task)(); });
        }

        condition_.notify_one();
        return result;
    }

    [[nodiscard]] size_t size() const noexcept { return workers_.size(); }

private:
    void worker_loop();
    void shutdown() noexcept;

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stopping_ = false;
};

} // namespace Mtree

#include "mtree/thread_pool.hpp"
#include "mtree/logger.hpp"
#include <string>

namespace Mtree {

ThreadPool::ThreadPool(size_t thread_count)
{
    if (thread_count == 0) {
        thread_count = 1;
    }
    Logger::instance().debug("Starting thread pool with " + std::to_string(thread_count) + " workers");

    try {
        workers_.reserve(thread_count);
        for (size_t i = 0; i < thread_count; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    } catch (...) {
        // 已经启动的线程必须先停下并 join，否则成员析构时 condition_ 仍被等待
        size_t started = workers_.size();
        shutdown();
        Logger::instance().error("Failed to start thread pool: " + std::to_string(started)
            + " of " + std::to_string(thread_count) + " workers started");
        throw;
    }
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

void ThreadPool::shutdown() noexcept
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::worker_loop()
{
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });

            if (stopping_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // packaged_task 自己捕获异常并写入 future
        task();
    }
}

} // namespace Mtree

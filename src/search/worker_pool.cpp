/**
 * @file worker_pool.cpp
 * @brief fixed worker pool lifecycle
 */
#include "tio/search/worker_pool.hpp"

namespace tio::search
{

WorkerPool::WorkerPool(std::size_t workers)
{
    const auto count = std::max<std::size_t>(1U, workers);
    threads_.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        threads_.emplace_back([this]() { worker_loop(); });
    }
}

WorkerPool::~WorkerPool()
{
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        stopping_ = true;
    }
    condition_.notify_all();
    for (auto &thread : threads_)
    {
        if (thread.joinable())
        {
            thread.join();
        }
    }
}

void WorkerPool::worker_loop()
{
    while (true)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock{mutex_};
            condition_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_ && queue_.empty())
            {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop();
        }
        // packaged_task stores exceptions in its future, nothing escapes here
        task();
    }
}

} // namespace tio::search

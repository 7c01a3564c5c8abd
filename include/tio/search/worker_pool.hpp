/**
 * @file worker_pool.hpp
 * @brief fixed-size std::thread pool for embarrassingly parallel evaluations uwu
 *
 * tasks go into one FIFO guarded by a mutex + condition_variable and come back
 * through std::future. map_ids() is the pattern both engines use: submit
 * (id, task) pairs, collect (id, result) pairs, put them back in id order so
 * the output never depends on scheduling.
 *
 * example (basic usage):
 * @code
 * tio::search::WorkerPool pool{4U};
 * auto squares = pool.map_ids<double>(0U, 8U, [](std::size_t id) { return double(id * id); });
 * @endcode
 */
#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace tio::search
{

class WorkerPool
{
public:
    /// spawns max(1, workers) threads
    explicit WorkerPool(std::size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool &)                     = delete;
    auto operator=(const WorkerPool &) -> WorkerPool & = delete;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return threads_.size(); }

    /**
     * @brief queues one callable, its return value (or exception) arrives through the future
     *
     * ⚠️ IMPURE FUNCTION (enqueues work for another thread)
     */
    template <typename Fn>
    [[nodiscard]] auto submit(Fn &&fn) -> std::future<std::invoke_result_t<Fn>>
    {
        using Result = std::invoke_result_t<Fn>;
        auto task    = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        auto future  = task->get_future();
        {
            const std::lock_guard<std::mutex> lock{mutex_};
            queue_.emplace([task]() { (*task)(); });
        }
        condition_.notify_one();
        return future;
    }

    /**
     * @brief runs fn(id) for id in [first, first + count), results in id order
     *
     * ⚠️ IMPURE FUNCTION (blocks until every task finished)
     *
     * an exception thrown by fn resurfaces here after all tasks of the batch
     * completed, so no task is left running against freed state.
     */
    template <typename Result, typename Fn>
    [[nodiscard]] auto map_ids(std::size_t first, std::size_t count, Fn fn) -> std::vector<Result>
    {
        std::vector<std::future<std::pair<std::size_t, Result>>> pending;
        pending.reserve(count);
        for (std::size_t id = first; id < first + count; ++id)
        {
            pending.push_back(submit([id, &fn]() { return std::pair<std::size_t, Result>{id, fn(id)}; }));
        }
        for (auto &future : pending)
        {
            future.wait();
        }

        std::vector<std::pair<std::size_t, Result>> collected;
        collected.reserve(count);
        for (auto &future : pending)
        {
            collected.push_back(future.get());
        }
        std::sort(collected.begin(), collected.end(),
                  [](const auto &lhs, const auto &rhs) { return lhs.first < rhs.first; });

        std::vector<Result> ordered;
        ordered.reserve(collected.size());
        for (auto &entry : collected)
        {
            ordered.push_back(std::move(entry.second));
        }
        return ordered;
    }

private:
    void worker_loop();

    std::vector<std::thread>          threads_;
    std::queue<std::function<void()>> queue_;
    std::mutex                        mutex_;
    std::condition_variable           condition_;
    bool                              stopping_{false};
};

} // namespace tio::search

/**
 * @file worker_pool.hpp
 * @brief Fixed-size pool of worker threads for background volume work
 * @details Tasks run on a private QThreadPool capped at a fixed number of
 *          threads, in FIFO order. submit() wraps the callable in a packaged
 *          task and hands back its future, so results and exceptions cross
 *          to the caller only through that future.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

namespace tomo_viewer::services {

/**
 * @brief Fixed-size FIFO worker pool
 *
 * Destruction discards tasks that have not started (their futures report
 * std::future_errc::broken_promise) and waits for running tasks to finish.
 */
class WorkerPool {
public:
    /// @param workerCount Number of threads; 0 is treated as 1
    explicit WorkerPool(std::size_t workerCount = 2);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    /**
     * @brief Queue a callable for execution on a worker thread
     * @return Future for the callable's result
     */
    template <typename Fn>
    [[nodiscard]] std::future<std::invoke_result_t<Fn>> submit(Fn&& fn) {
        using Result = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        auto future = task->get_future();
        enqueue([task]() { (*task)(); });
        return future;
    }

    [[nodiscard]] std::size_t workerCount() const noexcept;

    /// Tasks queued but not yet picked up by a worker
    [[nodiscard]] std::size_t pendingCount() const;

private:
    void enqueue(std::function<void()> job);

    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tomo_viewer::services

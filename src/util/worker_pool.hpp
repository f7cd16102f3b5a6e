#ifndef PIISHIELD_UTIL_WORKER_POOL_HPP
#define PIISHIELD_UTIL_WORKER_POOL_HPP

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @file worker_pool.hpp
 * @brief Fixed-size pool of worker threads used to process batch entries in parallel.
 *
 * Usage Example:
 *  @code
 *    piishield::util::WorkerPool pool(4);
 *    auto lengths = pool.mapOrdered(texts.size(),
 *        [&](std::size_t i) { return texts[i].size(); });
 *    // lengths[i] belongs to texts[i]
 *  @endcode
 */

namespace piishield {
namespace util {

/**
 * @class WorkerPool
 * @brief Queue of tasks drained by a fixed number of worker threads.
 *
 * - The constructor spawns the workers; the destructor drains the queue and joins them.
 * - enqueue(...) schedules one task and returns its future.
 * - mapOrdered(...) runs an index-based function over [0, count) and returns the
 *   results in index order, whatever order the workers finish in.
 */
class WorkerPool
{
public:
    /**
     * @param threadCount Number of worker threads. Zero uses the hardware concurrency.
     */
    explicit WorkerPool(std::size_t threadCount = 0)
        : stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<std::size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);
        for (std::size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

    ~WorkerPool()
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        condVar_.notify_all();
        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    std::size_t size() const { return workers_.size(); }

    /**
     * @brief Schedule @p f(args...) on a worker.
     * @return A future carrying the result or the exception thrown by the task.
     * @throw std::runtime_error if the pool is shutting down.
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>
    {
        using return_type = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));

        std::future<return_type> res = task->get_future();
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("WorkerPool: enqueue on stopped pool");
            }
            taskQueue_.emplace([task]() { (*task)(); });
        }
        condVar_.notify_one();
        return res;
    }

    /**
     * @brief Run @p fn(i) for every i in [0, count) and collect results by index.
     *
     * Every task is awaited before returning. If any task threw, the first
     * exception (by index) is rethrown after all tasks have finished.
     */
    template<typename F>
    auto mapOrdered(std::size_t count, F fn)
        -> std::vector<std::invoke_result_t<F, std::size_t>>
    {
        using result_type = std::invoke_result_t<F, std::size_t>;

        std::vector<std::future<result_type>> futures;
        futures.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            futures.push_back(enqueue(fn, i));
        }

        for (auto &future : futures) {
            future.wait();
        }

        std::vector<result_type> results;
        results.reserve(count);
        for (auto &future : futures) {
            results.push_back(future.get());
        }
        return results;
    }

private:
    void workerLoop()
    {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                condVar_.wait(lock, [this] {
                    return !taskQueue_.empty() || stop_;
                });
                if (stop_ && taskQueue_.empty()) {
                    return;
                }
                task = std::move(taskQueue_.front());
                taskQueue_.pop();
            }
            // packaged_task stores any exception in the future.
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> taskQueue_;
    std::mutex queueMutex_;
    std::condition_variable condVar_;
    bool stop_;
};

} // namespace util
} // namespace piishield

#endif // PIISHIELD_UTIL_WORKER_POOL_HPP

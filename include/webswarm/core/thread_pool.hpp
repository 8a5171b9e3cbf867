/*
 * webswarm - Thread pool used to fan out probes, assignments and agent runs
 */
#ifndef WEBSWARM_CORE_THREAD_POOL_HPP
#define WEBSWARM_CORE_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <atomic>
#include <string>

namespace webswarm {

class ThreadPool {
public:
    ThreadPool(size_t num_threads, const std::string& name = "pool");
    ~ThreadPool();

    // Fire-and-forget task
    void enqueue(std::function<void()> task);

    // Task whose result (or exception) is delivered through a future.
    // Throws std::runtime_error if the pool is already stopped.
    template<typename F>
    auto submit(F fn) -> std::future<decltype(fn())> {
        typedef decltype(fn()) R;
        std::shared_ptr<std::packaged_task<R()> > task =
            std::make_shared<std::packaged_task<R()> >(fn);
        std::future<R> fut = task->get_future();
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_) {
                throw std::runtime_error("thread pool '" + name_ + "' is stopped");
            }
            tasks_.push([task]() { (*task)(); });
        }
        condition_.notify_one();
        return fut;
    }

    size_t size() const { return threads_.size(); }

    // Get number of pending tasks
    size_t pending() const;

    // Drain queued tasks and join workers; idempotent
    void shutdown();

private:
    void worker();

    std::string name_;
    std::vector<std::thread> threads_;
    std::queue<std::function<void()> > tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;
};

} // namespace webswarm

#endif // WEBSWARM_CORE_THREAD_POOL_HPP

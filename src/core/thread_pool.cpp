#include <webswarm/core/thread_pool.hpp>
#include <webswarm/core/logger.hpp>

namespace webswarm {

ThreadPool::ThreadPool(size_t num_threads, const std::string& name)
    : name_(name), stop_(false) {
    if (num_threads == 0) num_threads = 1;
    for (size_t i = 0; i < num_threads; ++i) {
        threads_.emplace_back([this] { worker(); });
    }
    LOG_DEBUG("Thread pool '%s' started with %zu threads", name_.c_str(), num_threads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::enqueue(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_) {
            LOG_WARN("Cannot enqueue task - thread pool '%s' is stopped", name_.c_str());
            return;
        }
        tasks_.push(task);
    }
    condition_.notify_one();
}

size_t ThreadPool::pending() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return tasks_.size();
}

void ThreadPool::shutdown() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_) return;
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    LOG_DEBUG("Thread pool '%s' shutdown complete", name_.c_str());
}

void ThreadPool::worker() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(mutex_);

            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = tasks_.front();
            tasks_.pop();
        }

        // submit() tasks capture their own exceptions in the future
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Thread pool '%s' task threw exception: %s", name_.c_str(), e.what());
        }
    }
}

} // namespace webswarm

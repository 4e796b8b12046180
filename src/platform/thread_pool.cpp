#include <weft/platform/thread_pool.h>

#include <stdexcept>

namespace weft::platform {

ThreadPool::ThreadPool(size_t workers) {
    if (workers == 0) {
        workers = 1;
    }
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back([this](std::stop_token stop) { work(stop); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::execute(Task task) {
    {
        std::lock_guard lock(mutex_);
        if (!accepting_) {
            throw std::runtime_error("thread pool is shutting down");
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (!accepting_) return;
        accepting_ = false;
    }
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void ThreadPool::work(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    while (true) {
        // Returns early on stop; whatever is still queued gets run first
        cv_.wait(lock, stop, [this]() { return !queue_.empty(); });
        if (queue_.empty()) return;

        Task task = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();
        task();
        lock.lock();
    }
}

} // namespace weft::platform

#pragma once
#include <weft/platform/executor.h>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace weft::platform {

// Fixed set of worker threads for forked renders. Tasks run concurrently
// with each other and with the thread that posted them.
class ThreadPool : public Executor {
public:
    explicit ThreadPool(size_t workers = std::thread::hardware_concurrency());
    ~ThreadPool() override;

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Throws std::runtime_error once shutdown() has started.
    void execute(Task task) override;

    size_t size() const { return workers_.size(); }

    // Lets the workers finish everything already queued, then joins them.
    // Must not be called from a worker.
    void shutdown();

private:
    void work(std::stop_token stop);

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Task> queue_;
    bool accepting_ = true;
    std::vector<std::jthread> workers_;
};

} // namespace weft::platform

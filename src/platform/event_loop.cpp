#include <weft/platform/event_loop.h>

namespace weft::platform {

void EventLoop::post_task(Task task) {
    std::lock_guard lock(mutex_);
    tasks_.emplace_back(std::move(task));
}

size_t EventLoop::run_pending() {
    std::deque<Task> batch;
    {
        std::lock_guard lock(mutex_);
        batch.swap(tasks_);
    }

    for (auto& task : batch) {
        task();
    }
    return batch.size();
}

size_t EventLoop::run_until_idle() {
    size_t total = 0;
    while (size_t ran = run_pending()) {
        total += ran;
    }
    return total;
}

size_t EventLoop::pending_count() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

} // namespace weft::platform

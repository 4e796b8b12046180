#pragma once
#include <weft/platform/executor.h>

#include <deque>
#include <mutex>

namespace weft::platform {

// Cooperative executor: forked renders posted here run only when the host
// pumps the loop, on the pumping thread, one after another.
class EventLoop : public Executor {
public:
    EventLoop() = default;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void execute(Task task) override { post_task(std::move(task)); }

    void post_task(Task task);

    // Runs the tasks queued at the time of the call. Returns how many ran.
    size_t run_pending();

    // Keeps pumping, including tasks posted meanwhile, until the queue is
    // empty.
    size_t run_until_idle();

    size_t pending_count() const;

private:
    mutable std::mutex mutex_;
    std::deque<Task> tasks_;
};

} // namespace weft::platform

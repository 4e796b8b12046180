#pragma once
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>

namespace weft::stream {

// Receives a failure raised while a value travels from its source to the
// final observer.
using ErrorHandler = std::function<void(std::exception_ptr)>;

// Serial delivery queue in front of one observer. Values are applied one
// at a time in push order; a value pushed while another is being applied
// (from the observer itself or another thread) waits its turn.
template<typename T>
class Mailbox {
public:
    using Observer = std::function<void(const T&)>;

    explicit Mailbox(Observer observer, ErrorHandler on_error = {})
        : observer_(std::move(observer))
        , on_error_(std::move(on_error)) {}

    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    // Enqueue only; pair with drain().
    void push(T value) {
        std::lock_guard lock(mutex_);
        if (closed_) return;
        queue_.push_back(std::move(value));
    }

    // Applies queued values unless another call is already doing so.
    // An exception from the observer goes to the error handler and delivery
    // continues. Without a handler it propagates; remaining values stay
    // queued for the next drain.
    void drain() {
        std::unique_lock lock(mutex_);
        if (draining_ || closed_) return;
        draining_ = true;
        drainer_ = std::this_thread::get_id();

        while (!closed_ && !queue_.empty()) {
            T value = std::move(queue_.front());
            queue_.pop_front();
            lock.unlock();
            std::exception_ptr failure;
            try {
                observer_(value);
            } catch (...) {
                failure = std::current_exception();
            }
            if (failure && on_error_) {
                try {
                    on_error_(failure);
                    failure = nullptr;
                } catch (...) {
                    failure = std::current_exception();
                }
            }
            lock.lock();
            if (failure) {
                draining_ = false;
                cv_.notify_all();
                std::rethrow_exception(failure);
            }
        }

        draining_ = false;
        cv_.notify_all();
    }

    void deliver(T value) {
        push(std::move(value));
        drain();
    }

    // Drops pending values and waits for a delivery in progress on another
    // thread to finish.
    void close() {
        std::unique_lock lock(mutex_);
        closed_ = true;
        queue_.clear();
        if (draining_ && drainer_ != std::this_thread::get_id()) {
            cv_.wait(lock, [this]() { return !draining_; });
        }
    }

    bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

private:
    Observer observer_;
    ErrorHandler on_error_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool draining_ = false;
    bool closed_ = false;
    std::thread::id drainer_;
};

} // namespace weft::stream

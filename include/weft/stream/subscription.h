#pragma once
#include <functional>
#include <memory>
#include <mutex>

namespace weft::stream {

// Handle to an active subscription. Copies share state; cancel() is
// idempotent and, once it returns, no further value is delivered.
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> on_cancel)
        : state_(std::make_shared<State>()) {
        state_->on_cancel = std::move(on_cancel);
    }

    void cancel() {
        if (!state_) return;
        std::function<void()> on_cancel;
        {
            std::lock_guard lock(state_->mutex);
            if (state_->cancelled) return;
            state_->cancelled = true;
            on_cancel = std::move(state_->on_cancel);
        }
        if (on_cancel) on_cancel();
    }

    bool active() const {
        if (!state_) return false;
        std::lock_guard lock(state_->mutex);
        return !state_->cancelled;
    }

private:
    struct State {
        std::mutex mutex;
        bool cancelled = false;
        std::function<void()> on_cancel;
    };
    std::shared_ptr<State> state_;
};

} // namespace weft::stream

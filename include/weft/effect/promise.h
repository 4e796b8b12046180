#pragma once
#include <weft/core/errors.h>
#include <weft/effect/cancel_token.h>

#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>

namespace weft::effect {

// Single-assignment result that can be awaited with a CancelToken.
template<typename T>
class Promise {
public:
    Promise() : state_(std::make_shared<State>()) {}

    // First completion wins; later ones return false.
    bool complete(T value) {
        {
            std::lock_guard lock(state_->mutex);
            if (state_->done) return false;
            state_->value = std::move(value);
            state_->done = true;
        }
        state_->cv.notify_all();
        return true;
    }

    bool fail(std::exception_ptr error) {
        {
            std::lock_guard lock(state_->mutex);
            if (state_->done) return false;
            state_->error = std::move(error);
            state_->done = true;
        }
        state_->cv.notify_all();
        return true;
    }

    bool is_done() const {
        std::lock_guard lock(state_->mutex);
        return state_->done;
    }

    // Suspension point: blocks until completed or until `token` is
    // cancelled, in which case weft::Interrupted is thrown.
    T await(const CancelToken& token) const {
        auto state = state_;
        auto callback_id = token.on_cancel([state]() {
            std::lock_guard lock(state->mutex);
            state->cv.notify_all();
        });

        std::unique_lock lock(state->mutex);
        state->cv.wait(lock, [&]() { return state->done || token.is_cancelled(); });
        lock.unlock();
        token.remove_callback(callback_id);

        lock.lock();
        if (!state->done) {
            throw Interrupted();
        }
        if (state->error) {
            std::rethrow_exception(state->error);
        }
        return *state->value;
    }

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        std::optional<T> value;
        std::exception_ptr error;
    };
    std::shared_ptr<State> state_;
};

} // namespace weft::effect

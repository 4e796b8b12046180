#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace weft::effect {

// Shared cancellation flag. Copies observe the same state.
class CancelToken {
public:
    using Callback = std::function<void()>;
    using CallbackId = std::uint64_t;

    CancelToken();

    bool is_cancelled() const;

    // Idempotent. Callbacks run once, on the cancelling thread.
    void cancel();

    // Checkpoint: throws weft::Interrupted once cancelled.
    void throw_if_cancelled() const;

    // Runs `callback` on cancellation, or right away if already cancelled
    // (in which case 0 is returned).
    CallbackId on_cancel(Callback callback) const;
    void remove_callback(CallbackId id) const;

    bool operator==(const CancelToken& other) const { return state_ == other.state_; }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::unordered_map<CallbackId, Callback> callbacks;
        CallbackId next_id = 1;
    };
    std::shared_ptr<State> state_;
};

} // namespace weft::effect

#pragma once
#include <weft/stream/hub.h>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace weft::stream {

// Live value holder. Subscribers first receive the current value, then
// every later write. Writes are serialized by the signal itself.
template<typename T>
class Signal {
public:
    explicit Signal(T initial)
        : state_(std::make_shared<State>(std::move(initial))) {}

    T get() const {
        std::lock_guard lock(state_->value_mutex);
        return state_->value;
    }

    void set(T value) {
        auto state = state_;
        state->broadcast->publish([&state, &value]() {
            std::lock_guard lock(state->value_mutex);
            state->value = value;
            return value;
        });
    }

    // Atomic read-modify-write; `fn` must not touch this signal.
    void update(const std::function<T(const T&)>& fn) {
        auto state = state_;
        state->broadcast->publish([&state, &fn]() {
            std::lock_guard lock(state->value_mutex);
            state->value = fn(state->value);
            return state->value;
        });
    }

    Stream<T> stream() const {
        auto state = state_;
        return Stream<T>([state](typename Stream<T>::Observer observer, ErrorHandler on_error) {
            return state->broadcast->attach(std::move(observer), std::move(on_error), [&state]() {
                std::lock_guard lock(state->value_mutex);
                return std::optional<T>(state->value);
            });
        });
    }

    size_t subscriber_count() const { return state_->broadcast->size(); }

private:
    struct State {
        explicit State(T initial)
            : value(std::move(initial))
            , broadcast(std::make_shared<detail::Broadcast<T>>()) {}

        mutable std::mutex value_mutex;
        T value;
        std::shared_ptr<detail::Broadcast<T>> broadcast;
    };
    std::shared_ptr<State> state_;
};

} // namespace weft::stream

#include <weft/effect/cancel_token.h>
#include <weft/core/errors.h>

#include <vector>

namespace weft::effect {

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

bool CancelToken::is_cancelled() const {
    return state_->cancelled.load();
}

void CancelToken::cancel() {
    std::vector<Callback> to_run;
    {
        std::lock_guard lock(state_->mutex);
        if (state_->cancelled.exchange(true)) {
            return;
        }
        for (auto& [id, callback] : state_->callbacks) {
            to_run.push_back(std::move(callback));
        }
        state_->callbacks.clear();
    }
    for (auto& callback : to_run) {
        callback();
    }
}

void CancelToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw Interrupted();
    }
}

CancelToken::CallbackId CancelToken::on_cancel(Callback callback) const {
    {
        std::lock_guard lock(state_->mutex);
        if (!state_->cancelled.load()) {
            CallbackId id = state_->next_id++;
            state_->callbacks.emplace(id, std::move(callback));
            return id;
        }
    }
    callback();
    return 0;
}

void CancelToken::remove_callback(CallbackId id) const {
    if (id == 0) return;
    std::lock_guard lock(state_->mutex);
    state_->callbacks.erase(id);
}

} // namespace weft::effect

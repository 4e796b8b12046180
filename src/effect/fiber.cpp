#include <weft/effect/fiber.h>
#include <weft/core/errors.h>

namespace weft::effect {

namespace {
thread_local const Fiber* current_fiber = nullptr;
} // namespace

const char* exit_kind_name(ExitKind kind) {
    switch (kind) {
        case ExitKind::Pending:     return "pending";
        case ExitKind::Success:     return "success";
        case ExitKind::Interrupted: return "interrupted";
        case ExitKind::Defect:      return "defect";
    }
    return "unknown";
}

Fiber::Fiber(std::string name, CancelToken token, Body body)
    : name_(std::move(name))
    , token_(std::move(token))
    , body_(std::move(body)) {}

void Fiber::set_exit_handler(ExitHandler handler) {
    std::lock_guard lock(mutex_);
    exit_handler_ = std::move(handler);
}

void Fiber::start(platform::Executor& executor) {
    auto self = shared_from_this();
    try {
        executor.execute([self]() { self->run(); });
    } catch (...) {
        bool pending;
        {
            std::lock_guard lock(mutex_);
            pending = state_ == State::Pending;
            if (pending) state_ = State::Running;
        }
        if (pending) {
            finish({ExitKind::Defect, std::current_exception()});
        }
    }
}

void Fiber::interrupt() {
    token_.cancel();
}

void Fiber::join() {
    std::unique_lock lock(mutex_);
    if (state_ == State::Pending) {
        state_ = State::Running;
        lock.unlock();
        finish({ExitKind::Interrupted, nullptr});
        return;
    }
    if (state_ == State::Running && runner_ == std::this_thread::get_id()) {
        return;
    }
    cv_.wait(lock, [this]() { return state_ == State::Done; });
}

bool Fiber::done() const {
    std::lock_guard lock(mutex_);
    return state_ == State::Done;
}

void Fiber::set_owner(std::weak_ptr<Scope> owner) {
    std::lock_guard lock(mutex_);
    owner_ = std::move(owner);
}

std::shared_ptr<Scope> Fiber::owner() const {
    std::lock_guard lock(mutex_);
    return owner_.lock();
}

const Fiber* Fiber::current() {
    return current_fiber;
}

Exit Fiber::exit() const {
    std::lock_guard lock(mutex_);
    return exit_;
}

void Fiber::run() {
    {
        std::lock_guard lock(mutex_);
        if (state_ != State::Pending) {
            return;
        }
        state_ = State::Running;
        runner_ = std::this_thread::get_id();
    }

    Exit result{ExitKind::Success, nullptr};
    if (token_.is_cancelled()) {
        result.kind = ExitKind::Interrupted;
    } else {
        const Fiber* previous = current_fiber;
        current_fiber = this;
        try {
            body_();
        } catch (const Interrupted&) {
            result.kind = ExitKind::Interrupted;
        } catch (const ScopeClosedError&) {
            // Forking from a scope that is being torn down is interruption
            // when the fiber itself is cancelled.
            if (token_.is_cancelled()) {
                result.kind = ExitKind::Interrupted;
            } else {
                result = {ExitKind::Defect, std::current_exception()};
            }
        } catch (...) {
            result = {ExitKind::Defect, std::current_exception()};
        }
        current_fiber = previous;
    }
    finish(std::move(result));
}

void Fiber::finish(Exit exit) {
    ExitHandler handler;
    {
        std::lock_guard lock(mutex_);
        exit_ = exit;
        handler = std::move(exit_handler_);
        exit_handler_ = nullptr;
        // Release captured state now that the body can no longer run
        body_ = nullptr;
    }
    if (handler) {
        handler(*this, exit);
    }
    {
        std::lock_guard lock(mutex_);
        state_ = State::Done;
    }
    cv_.notify_all();
}

} // namespace weft::effect

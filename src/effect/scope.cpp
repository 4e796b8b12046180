#include <weft/effect/scope.h>

#include <algorithm>

namespace weft::effect {

// ---------------------------------------------------------------------------
// CloseResult
// ---------------------------------------------------------------------------

std::vector<std::string> CloseResult::messages() const {
    std::vector<std::string> result;
    result.reserve(defects.size());
    for (const auto& defect : defects) {
        result.push_back(describe_exception(defect));
    }
    return result;
}

void CloseResult::merge(CloseResult&& other) {
    defects.insert(defects.end(),
                   std::make_move_iterator(other.defects.begin()),
                   std::make_move_iterator(other.defects.end()));
    other.defects.clear();
}

void CloseResult::rethrow_if_failed(const std::string& context) const {
    if (ok()) return;
    std::string message = context + ": " + std::to_string(defects.size()) + " finalizer defect(s)";
    for (const auto& text : messages()) {
        message += "; " + text;
    }
    throw DefectError(message, defects);
}

// ---------------------------------------------------------------------------
// Scope
// ---------------------------------------------------------------------------

Scope::Scope(std::string label, std::weak_ptr<Scope> parent)
    : label_(std::move(label))
    , parent_(std::move(parent)) {}

std::shared_ptr<Scope> Scope::open(std::string label) {
    return std::shared_ptr<Scope>(new Scope(std::move(label), {}));
}

std::shared_ptr<Scope> Scope::fork(std::string label) {
    std::lock_guard lock(mutex_);
    if (state_ != State::Open) {
        throw ScopeClosedError("cannot fork scope '" + label_ + "': already closing");
    }
    auto child = std::shared_ptr<Scope>(
        new Scope(label.empty() ? label_ : std::move(label), weak_from_this()));
    children_.push_back(child);
    return child;
}

bool Scope::add_finalizer(Finalizer finalizer) {
    std::lock_guard lock(mutex_);
    if (state_ != State::Open) {
        return false;
    }
    finalizers_.push_back(std::move(finalizer));
    return true;
}

bool Scope::add_fiber(std::shared_ptr<Fiber> fiber) {
    fiber->set_owner(weak_from_this());
    {
        std::lock_guard lock(mutex_);
        if (state_ == State::Open) {
            fibers_.push_back(std::move(fiber));
            return true;
        }
    }
    fiber->interrupt();
    return false;
}

CloseResult Scope::close() {
    {
        std::unique_lock lock(mutex_);
        if (state_ == State::Closed) {
            return {};
        }
        if (state_ == State::Closing) {
            // The closer joins every fiber in the subtree, so such a fiber
            // must not wait for it.
            if (closer_ != std::this_thread::get_id() && !called_from_subtree_fiber()) {
                cv_.wait(lock, [this]() { return state_ == State::Closed; });
            }
            return {};
        }
        state_ = State::Closing;
        closer_ = std::this_thread::get_id();
    }

    // 1. Request cancellation of everything running under this scope
    cancel_tree();

    // 2. Wait for owned fibers to observe it
    std::vector<std::shared_ptr<Fiber>> fibers;
    {
        std::lock_guard lock(mutex_);
        fibers.swap(fibers_);
    }
    for (auto& fiber : fibers) {
        fiber->join();
    }

    CloseResult result;

    // 3. Children, most recently created first
    std::vector<std::shared_ptr<Scope>> children;
    {
        std::lock_guard lock(mutex_);
        children.swap(children_);
    }
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        result.merge((*it)->close());
    }

    // 4. Own finalizers, most recently registered first
    std::vector<Finalizer> finalizers;
    {
        std::lock_guard lock(mutex_);
        finalizers.swap(finalizers_);
    }
    for (auto it = finalizers.rbegin(); it != finalizers.rend(); ++it) {
        try {
            (*it)();
        } catch (...) {
            result.defects.push_back(std::current_exception());
        }
    }

    {
        std::lock_guard lock(mutex_);
        state_ = State::Closed;
    }
    cv_.notify_all();

    if (auto parent = parent_.lock()) {
        parent->forget_child(this);
    }
    return result;
}

bool Scope::is_open() const {
    std::lock_guard lock(mutex_);
    return state_ == State::Open;
}

bool Scope::is_closed() const {
    std::lock_guard lock(mutex_);
    return state_ == State::Closed;
}

size_t Scope::child_count() const {
    std::lock_guard lock(mutex_);
    return children_.size();
}

size_t Scope::finalizer_count() const {
    std::lock_guard lock(mutex_);
    return finalizers_.size();
}

void Scope::cancel_tree() {
    std::vector<std::shared_ptr<Scope>> children;
    {
        std::lock_guard lock(mutex_);
        children = children_;
    }
    token_.cancel();
    for (auto& child : children) {
        child->cancel_tree();
    }
}

// Walks up from the owner of the calling fiber. parent_ never changes after
// construction, so no scope lock is taken on the way.
bool Scope::called_from_subtree_fiber() const {
    const Fiber* fiber = Fiber::current();
    if (!fiber) return false;
    for (auto scope = fiber->owner(); scope; scope = scope->parent()) {
        if (scope.get() == this) return true;
    }
    return false;
}

void Scope::forget_child(const Scope* child) {
    std::lock_guard lock(mutex_);
    children_.erase(std::remove_if(children_.begin(), children_.end(),
        [child](const std::shared_ptr<Scope>& c) { return c.get() == child; }),
        children_.end());
}

} // namespace weft::effect

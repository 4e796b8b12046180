#pragma once
#include <weft/core/errors.h>
#include <weft/effect/cancel_token.h>
#include <weft/effect/fiber.h>

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace weft::effect {

// Failures collected while closing a scope and its descendants.
struct CloseResult {
    std::vector<std::exception_ptr> defects;

    bool ok() const { return defects.empty(); }
    std::vector<std::string> messages() const;
    void merge(CloseResult&& other);

    // Throws DefectError carrying every collected defect.
    void rethrow_if_failed(const std::string& context) const;
};

// Lifecycle container. Finalizers run in reverse registration order, once,
// after every child scope has been closed in reverse creation order and
// every owned fiber has stopped.
class Scope : public std::enable_shared_from_this<Scope> {
public:
    using Finalizer = std::function<void()>;

    static std::shared_ptr<Scope> open(std::string label = "root");

    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

    // Child scope closed automatically with this one.
    // Throws ScopeClosedError once this scope is closing.
    std::shared_ptr<Scope> fork(std::string label = {});

    // Returns false when the scope is already closing; the caller then
    // releases the resource itself.
    bool add_finalizer(Finalizer finalizer);

    // Takes ownership of a fiber: close() interrupts and joins it.
    // Returns false (and interrupts the fiber) when the scope is closing.
    bool add_fiber(std::shared_ptr<Fiber> fiber);

    // Idempotent. A concurrent second caller blocks until the first one
    // finished and gets an empty result; a re-entrant call from the closing
    // thread, or from a fiber owned by this scope or any of its descendants,
    // returns immediately.
    CloseResult close();

    bool is_open() const;
    bool is_closed() const;

    // Cancelled for this scope and every descendant when closing starts.
    const CancelToken& token() const { return token_; }

    const std::string& label() const { return label_; }
    std::shared_ptr<Scope> parent() const { return parent_.lock(); }
    size_t child_count() const;
    size_t finalizer_count() const;

private:
    enum class State { Open, Closing, Closed };

    Scope(std::string label, std::weak_ptr<Scope> parent);

    void cancel_tree();
    bool called_from_subtree_fiber() const;
    void forget_child(const Scope* child);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    State state_ = State::Open;
    std::thread::id closer_;

    std::string label_;
    std::weak_ptr<Scope> parent_;
    std::vector<std::shared_ptr<Scope>> children_;
    std::vector<Finalizer> finalizers_;
    std::vector<std::shared_ptr<Fiber>> fibers_;
    CancelToken token_;
};

// Acquires a resource and registers its release on `scope`. When the scope
// is already closing the resource is released right away and
// weft::Interrupted is thrown.
template<typename Acquire, typename Release>
auto acquire_release(Scope& scope, Acquire&& acquire, Release release) -> decltype(acquire()) {
    auto resource = acquire();
    if (!scope.add_finalizer([release, resource]() { release(resource); })) {
        release(resource);
        throw Interrupted();
    }
    return resource;
}

} // namespace weft::effect

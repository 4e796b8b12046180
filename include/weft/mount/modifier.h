#pragma once
#include <weft/core/unit.h>
#include <weft/dom/dom_ops.h>
#include <weft/effect/promise.h>
#include <weft/effect/runtime.h>
#include <weft/effect/scope.h>
#include <weft/stream/stream.h>

#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace weft::mount {

using dom::NodeId;
using dom::kNoNode;

// Where a Modifier inserts: under `parent`, before `before` (or last).
struct MountPoint {
    NodeId parent = kNoNode;
    NodeId before = kNoNode;
};

// Everything a Modifier needs, passed explicitly.
struct MountContext {
    effect::Runtime* runtime = nullptr;
    MountPoint point;
    std::shared_ptr<effect::Scope> scope;

    dom::DomAdapter& dom() const { return runtime->dom(); }

    // Cancellation checkpoint; throws weft::Interrupted.
    void checkpoint() const { scope->token().throw_if_cancelled(); }

    MountContext within(std::shared_ptr<effect::Scope> child, MountPoint at) const {
        return MountContext{runtime, at, std::move(child)};
    }
    MountContext within(std::shared_ptr<effect::Scope> child) const {
        return within(std::move(child), point);
    }

    // Creates a node, ties its removal to `scope` and inserts it at `point`.
    NodeId mount_node(dom::DomOp create) const;

    // Throws Interrupted if the scope is closing, a defect otherwise.
    [[noreturn]] void fail_mutation(const std::string& what) const;
};

template<typename T>
class Modifier {
public:
    using value_type = T;
    using Body = std::function<T(const MountContext&)>;

    explicit Modifier(Body body) : body_(std::move(body)) {}

    T run(const MountContext& ctx) const { return body_(ctx); }

    template<typename F>
    auto map(F transform) const -> Modifier<std::decay_t<std::invoke_result_t<F, T>>> {
        using U = std::decay_t<std::invoke_result_t<F, T>>;
        auto body = body_;
        return Modifier<U>([body, transform](const MountContext& ctx) {
            return transform(body(ctx));
        });
    }

    // `next` receives this modifier's value and returns the modifier to run
    // after it, at the same mount point and scope.
    template<typename F>
    auto and_then(F next) const -> std::invoke_result_t<F, T> {
        using Next = std::invoke_result_t<F, T>;
        auto body = body_;
        return Next([body, next](const MountContext& ctx) {
            return next(body(ctx)).run(ctx);
        });
    }

    Modifier<Unit> discard() const {
        auto body = body_;
        return Modifier<Unit>([body](const MountContext& ctx) {
            body(ctx);
            return Unit{};
        });
    }

private:
    Body body_;
};

template<typename T>
Modifier<T> pure(T value) {
    return Modifier<T>([value](const MountContext&) { return value; });
}

// Runs each modifier in order at the same mount point and scope.
Modifier<Unit> sequence(std::vector<Modifier<Unit>> modifiers);

template<typename... Ts>
Modifier<Unit> sequence(Modifier<Ts>... modifiers) {
    return sequence(std::vector<Modifier<Unit>>{modifiers.discard()...});
}

// Suspension point: waits for `promise`, giving up with Interrupted when
// the scope closes first.
template<typename T>
Modifier<T> suspend(effect::Promise<T> promise) {
    return Modifier<T>([promise](const MountContext& ctx) {
        return promise.await(ctx.scope->token());
    });
}

// Runs `effect` for its side effect only, after a checkpoint.
Modifier<Unit> perform(std::function<void(const MountContext&)> effect);

// Subscribes `apply` to `values` under a scope forked from ctx.scope, so the
// subscription ends when that scope closes. Values arriving after the scope
// started closing are dropped; failures of `apply`, and of any operator
// between the source and `apply`, go to the runtime's defect sink tagged
// with `label`.
// Error handler body for stream subscriptions owned by a scope. Interrupted
// means the subscriber is being torn down and is not a defect.
void report_stream_failure(effect::Runtime& runtime, const std::string& module,
                           const std::string& stage, std::exception_ptr error);

template<typename T>
void bind_stream(const MountContext& ctx, const std::string& label,
                 const stream::Stream<T>& values, std::function<void(const T&)> apply) {
    auto scope = ctx.scope->fork(label);
    auto token = scope->token();
    effect::Runtime* runtime = ctx.runtime;

    auto subscription = values.subscribe(
        [token, apply](const T& value) {
            if (token.is_cancelled()) return;
            apply(value);
        },
        [runtime, label](std::exception_ptr error) {
            report_stream_failure(*runtime, "binding", label, std::move(error));
        });

    if (!scope->add_finalizer([subscription]() mutable { subscription.cancel(); })) {
        subscription.cancel();
        throw Interrupted();
    }
}

} // namespace weft::mount

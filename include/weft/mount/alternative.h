#pragma once
#include <weft/core/config.h>
#include <weft/mount/modifier.h>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>

namespace weft::mount {

namespace detail {

// Single-slot renderer: holds the last value and the scope of the subtree
// rendered for it. Content goes before `point.before`, the slot's marker.
template<typename T>
class AlternativeSlot {
public:
    enum class Strategy { Blocking, Forked };
    using Render = std::function<Modifier<Unit>(const T&)>;

    AlternativeSlot(Strategy strategy, effect::Runtime* runtime, MountPoint point,
                    std::shared_ptr<effect::Scope> scope, Render render)
        : strategy_(strategy)
        , runtime_(runtime)
        , point_(point)
        , scope_(std::move(scope))
        , render_(std::move(render)) {}

    // Replaces the current subtree unless `value` equals the last one.
    void update(const T& value) {
        std::lock_guard lock(mutex_);
        if (last_ && *last_ == value) return;

        if (current_) {
            // Cancels, joins and rolls back a render still in flight.
            runtime_->report_close("alternative", "replace", current_->close());
            current_.reset();
        }
        last_ = value;

        std::shared_ptr<effect::Scope> next;
        try {
            next = scope_->fork("slot");
        } catch (const ScopeClosedError&) {
            // slot is being torn down
            last_.reset();
            return;
        }
        current_ = next;

        MountContext ctx{runtime_, point_, next};
        if (strategy_ == Strategy::Blocking) {
            try {
                render_(value).run(ctx);
            } catch (const Interrupted&) {
                // slot closed while rendering
            } catch (...) {
                runtime_->report_close("alternative", "rollback", next->close());
                current_.reset();
                last_.reset();
                throw;
            }
            return;
        }

        auto render = render_;
        effect::Runtime* runtime = runtime_;
        runtime_->fork(*next, "alternative", [render, value, ctx, runtime]() {
            try {
                render(value).run(ctx);
            } catch (const Interrupted&) {
                throw;
            } catch (...) {
                // Roll back the partial subtree; the defect itself is
                // reported when the fiber exits.
                runtime->report_close("alternative", "rollback", ctx.scope->close());
                throw;
            }
        });
    }

private:
    Strategy strategy_;
    effect::Runtime* runtime_;
    MountPoint point_;
    std::shared_ptr<effect::Scope> scope_;
    Render render_;

    std::mutex mutex_;
    std::optional<T> last_;
    std::shared_ptr<effect::Scope> current_;
};

template<typename T>
Modifier<Unit> mount_alternative(typename AlternativeSlot<T>::Strategy strategy,
                                 stream::Stream<T> values,
                                 typename AlternativeSlot<T>::Render render) {
    return Modifier<Unit>([strategy, values, render](const MountContext& ctx) {
        auto scope = ctx.scope->fork("alternative");
        NodeId marker = ctx.within(scope).mount_node(
            dom::op::CreateMarker{core::config::kSlotMarker});

        auto slot = std::make_shared<AlternativeSlot<T>>(
            strategy, ctx.runtime, MountPoint{ctx.point.parent, marker}, scope, render);
        effect::Runtime* runtime = ctx.runtime;
        auto token = scope->token();

        auto subscription = values.subscribe(
            [slot, token](const T& value) {
                if (token.is_cancelled()) return;
                slot->update(value);
            },
            [runtime](std::exception_ptr error) {
                report_stream_failure(*runtime, "alternative", "render", std::move(error));
            });

        if (!scope->add_finalizer([subscription]() mutable { subscription.cancel(); })) {
            subscription.cancel();
            throw Interrupted();
        }
        return Unit{};
    });
}

} // namespace detail

// At most one subtree for the latest value of `values`, rendered
// synchronously on the delivering thread. Equal consecutive values keep the
// current subtree.
template<typename T>
Modifier<Unit> mount_one(stream::Stream<T> values,
                         std::type_identity_t<std::function<Modifier<Unit>(const T&)>> render) {
    using Slot = detail::AlternativeSlot<T>;
    return detail::mount_alternative<T>(Slot::Strategy::Blocking, std::move(values), std::move(render));
}

// Like mount_one, but each render runs as a fiber on the runtime's executor.
// A newer value cancels the render in flight and rolls back whatever it
// already mounted before the next one starts.
template<typename T>
Modifier<Unit> mount_one_forked(stream::Stream<T> values,
                                std::type_identity_t<std::function<Modifier<Unit>(const T&)>> render) {
    using Slot = detail::AlternativeSlot<T>;
    return detail::mount_alternative<T>(Slot::Strategy::Forked, std::move(values), std::move(render));
}

} // namespace weft::mount

#pragma once
#include <weft/dom/event.h>
#include <weft/mount/modifier.h>
#include <weft/stream/hub.h>

#include <functional>
#include <string>
#include <type_traits>

namespace weft::mount {

// Copy of a dispatched event that outlives the dispatch.
struct EventValue {
    std::string type;
    NodeId target = kNoNode;
    NodeId current_target = kNoNode;
    dom::EventPhase phase = dom::EventPhase::None;
    std::string detail;
    bool default_prevented = false;

    bool operator==(const EventValue&) const = default;
};

EventValue snapshot(const dom::Event& event);

namespace detail {

// Attaches `listener` to the element at the mount point for the lifetime
// of ctx.scope.
void attach_listener(const MountContext& ctx, const std::string& type, bool capture,
                     dom::EventTarget::EventListener listener);

} // namespace detail

// Listener on the element at the mount point. Each firing goes through the
// transformation first, on the live event, then to the handler.
//
// Several listeners for one event on one element fire in the order they
// were attached, so merged streams of them see events in that order.
template<typename T>
class EventBinding {
public:
    using Transform = std::function<T(dom::Event&)>;

    EventBinding(std::string type, bool capture, Transform transform)
        : type_(std::move(type))
        , capture_(capture)
        , transform_(std::move(transform)) {}

    const std::string& type() const { return type_; }

    // Listen during the capture phase instead of bubbling.
    EventBinding capture() const {
        return EventBinding(type_, true, transform_);
    }

    // `f` takes either the value so far or the live dom::Event (to call
    // prevent_default() and the like); earlier transformations still run.
    template<typename F>
    auto map(F f) const {
        auto transform = transform_;
        if constexpr (std::is_invocable_v<F, const T&>) {
            using U = std::decay_t<std::invoke_result_t<F, const T&>>;
            return EventBinding<U>(type_, capture_, [transform, f](dom::Event& event) {
                return f(transform(event));
            });
        } else {
            using U = std::decay_t<std::invoke_result_t<F, dom::Event&>>;
            return EventBinding<U>(type_, capture_, [transform, f](dom::Event& event) {
                transform(event);
                return f(event);
            });
        }
    }

    Modifier<Unit> bind(std::function<void(const T&)> handler) const {
        auto type = type_;
        auto capture = capture_;
        auto transform = transform_;
        return Modifier<Unit>([type, capture, transform, handler](const MountContext& ctx) {
            auto token = ctx.scope->token();
            effect::Runtime* runtime = ctx.runtime;
            detail::attach_listener(ctx, type, capture,
                [token, runtime, type, transform, handler](dom::Event& event) {
                    if (token.is_cancelled()) return;
                    try {
                        handler(transform(event));
                    } catch (const Interrupted&) {
                        // handler's scope is closing
                    } catch (...) {
                        runtime->report_defect("event", type, std::current_exception());
                    }
                });
            return Unit{};
        });
    }

    // Firings as a stream; only firings after subscription are seen.
    Modifier<stream::Stream<T>> stream() const {
        auto type = type_;
        auto capture = capture_;
        auto transform = transform_;
        return Modifier<stream::Stream<T>>([type, capture, transform](const MountContext& ctx) {
            stream::Hub<T> hub;
            auto token = ctx.scope->token();
            effect::Runtime* runtime = ctx.runtime;
            detail::attach_listener(ctx, type, capture,
                [hub, token, runtime, type, transform](dom::Event& event) mutable {
                    if (token.is_cancelled()) return;
                    try {
                        hub.publish(transform(event));
                    } catch (const Interrupted&) {
                        // a subscriber's scope is closing
                    } catch (...) {
                        runtime->report_defect("event", type, std::current_exception());
                    }
                });
            return hub.stream();
        });
    }

private:
    std::string type_;
    bool capture_;
    Transform transform_;
};

EventBinding<EventValue> on(std::string type);

template<typename F>
auto on(std::string type, F transform) -> EventBinding<std::decay_t<std::invoke_result_t<F, dom::Event&>>> {
    using T = std::decay_t<std::invoke_result_t<F, dom::Event&>>;
    return EventBinding<T>(std::move(type), false, std::move(transform));
}

} // namespace weft::mount

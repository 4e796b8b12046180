#include <weft/mount/events.h>

namespace weft::mount {

EventValue snapshot(const dom::Event& event) {
    EventValue value;
    value.type = event.type();
    value.target = event.target();
    value.current_target = event.current_target();
    value.phase = event.phase();
    value.detail = event.detail();
    value.default_prevented = event.default_prevented();
    return value;
}

namespace detail {

void attach_listener(const MountContext& ctx, const std::string& type, bool capture,
                     dom::EventTarget::EventListener listener) {
    ctx.checkpoint();
    dom::DomAdapter* adapter = &ctx.dom();
    NodeId node = ctx.point.parent;
    dom::ListenerId id = effect::acquire_release(*ctx.scope,
        [adapter, node, &type, &listener, capture]() {
            return adapter->add_listener(node, type, std::move(listener), capture);
        },
        [adapter, node](dom::ListenerId listener_id) {
            if (listener_id != 0) adapter->remove_listener(node, listener_id);
        });
    if (id == 0) {
        ctx.fail_mutation("cannot listen for '" + type + "' on #" + std::to_string(node));
    }
}

} // namespace detail

EventBinding<EventValue> on(std::string type) {
    return EventBinding<EventValue>(std::move(type), false,
        [](dom::Event& event) { return snapshot(event); });
}

} // namespace weft::mount

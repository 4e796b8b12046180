#include <weft/mount/element.h>

#include <stdexcept>

namespace weft::mount {

namespace {

// Mutation on a node that vanished: fine while tearing down, a defect otherwise.
void require_applied(bool ok, const effect::CancelToken& token, const std::string& what) {
    if (ok) return;
    token.throw_if_cancelled();
    throw std::runtime_error(what);
}

} // namespace

Modifier<NodeId> create(const std::string& tag, std::vector<Modifier<Unit>> children) {
    return Modifier<NodeId>([tag, children = std::move(children)](const MountContext& ctx) {
        NodeId element = ctx.mount_node(dom::op::CreateElement{tag});

        auto inner = ctx.scope->fork("<" + tag + ">");
        MountContext child_ctx = ctx.within(inner, MountPoint{element, kNoNode});
        for (const auto& child : children) {
            child.run(child_ctx);
        }
        return element;
    });
}

Modifier<NodeId> text(const std::string& data) {
    return Modifier<NodeId>([data](const MountContext& ctx) {
        return ctx.mount_node(dom::op::CreateText{data});
    });
}

Modifier<NodeId> text(stream::Stream<std::string> data) {
    return Modifier<NodeId>([data = std::move(data)](const MountContext& ctx) {
        NodeId node = ctx.mount_node(dom::op::CreateText{""});
        dom::DomAdapter* adapter = &ctx.dom();
        auto token = ctx.scope->token();
        bind_stream<std::string>(ctx, "text", data, [adapter, node, token](const std::string& value) {
            require_applied(adapter->set_text(node, value), token,
                            "text node #" + std::to_string(node) + " is gone");
        });
        return node;
    });
}

// ---------------------------------------------------------------------------
// AttributeBinding
// ---------------------------------------------------------------------------

Modifier<Unit> AttributeBinding::set(const std::string& value) const {
    return Modifier<Unit>([name = name_, value](const MountContext& ctx) {
        ctx.checkpoint();
        if (!ctx.dom().set_attribute(ctx.point.parent, name, value)) {
            ctx.fail_mutation("cannot set attribute '" + name + "' on #" +
                              std::to_string(ctx.point.parent));
        }
        return Unit{};
    });
}

Modifier<Unit> AttributeBinding::bind(stream::Stream<std::string> values) const {
    return Modifier<Unit>([name = name_, values = std::move(values)](const MountContext& ctx) {
        ctx.checkpoint();
        dom::DomAdapter* adapter = &ctx.dom();
        NodeId node = ctx.point.parent;
        auto token = ctx.scope->token();
        bind_stream<std::string>(ctx, "attribute:" + name, values,
            [adapter, node, name, token](const std::string& value) {
                require_applied(adapter->set_attribute(node, name, value), token,
                                "cannot set attribute '" + name + "' on #" + std::to_string(node));
            });
        return Unit{};
    });
}

Modifier<Unit> AttributeBinding::remove() const {
    return Modifier<Unit>([name = name_](const MountContext& ctx) {
        ctx.checkpoint();
        if (!ctx.dom().remove_attribute(ctx.point.parent, name)) {
            ctx.fail_mutation("element #" + std::to_string(ctx.point.parent) + " is gone");
        }
        return Unit{};
    });
}

AttributeBinding attribute(std::string name) {
    return AttributeBinding(std::move(name));
}

} // namespace weft::mount

#pragma once
#include <weft/mount/modifier.h>
#include <weft/stream/stream.h>

#include <string>
#include <vector>

namespace weft::mount {

// Element `tag` inserted at the mount point, with `children` mounted inside
// it under a forked scope. Yields the element's id.
Modifier<NodeId> create(const std::string& tag, std::vector<Modifier<Unit>> children);

template<typename... Ts>
Modifier<NodeId> create(const std::string& tag, Modifier<Ts>... children) {
    return create(tag, std::vector<Modifier<Unit>>{children.discard()...});
}

// Static text node.
Modifier<NodeId> text(const std::string& data);

// Text node whose data follows `data`; empty until the first value.
Modifier<NodeId> text(stream::Stream<std::string> data);

// Modifier applying to the element at the mount point (its parent).
class AttributeBinding {
public:
    explicit AttributeBinding(std::string name) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }

    Modifier<Unit> set(const std::string& value) const;

    // Every emitted value is applied, in emission order.
    Modifier<Unit> bind(stream::Stream<std::string> values) const;

    Modifier<Unit> remove() const;

private:
    std::string name_;
};

AttributeBinding attribute(std::string name);

} // namespace weft::mount

#include <weft/dom/dom_adapter.h>

#include <sstream>

namespace weft::dom {

// ---------------------------------------------------------------------------
// DomAdapter
// ---------------------------------------------------------------------------

NodeId DomAdapter::create_element(const std::string& tag) {
    return apply(op::CreateElement{tag}).node;
}

NodeId DomAdapter::create_text(const std::string& data) {
    return apply(op::CreateText{data}).node;
}

NodeId DomAdapter::create_marker(const std::string& label) {
    return apply(op::CreateMarker{label}).node;
}

bool DomAdapter::set_attribute(NodeId node, const std::string& name, const std::string& value) {
    return apply(op::SetAttribute{node, name, value}).ok;
}

bool DomAdapter::remove_attribute(NodeId node, const std::string& name) {
    return apply(op::RemoveAttribute{node, name}).ok;
}

bool DomAdapter::set_text(NodeId node, const std::string& data) {
    return apply(op::SetText{node, data}).ok;
}

ListenerId DomAdapter::add_listener(NodeId node, const std::string& type,
                                    EventTarget::EventListener listener, bool capture) {
    return apply(op::AddListener{node, type, std::move(listener), capture}).listener;
}

bool DomAdapter::remove_listener(NodeId node, ListenerId listener) {
    return apply(op::RemoveListener{node, listener}).ok;
}

bool DomAdapter::insert(NodeId parent, NodeId node, NodeId before) {
    return apply(op::Insert{parent, node, before}).ok;
}

bool DomAdapter::insert_after(NodeId parent, NodeId node, NodeId after) {
    return apply(op::InsertAfter{parent, node, after}).ok;
}

bool DomAdapter::remove(NodeId node) {
    return apply(op::Remove{node}).ok;
}

// ---------------------------------------------------------------------------
// OperationApplier: runs one DomOp with the adapter lock held
// ---------------------------------------------------------------------------

struct OperationApplier {
    DocumentAdapter& adapter;

    OpResult operator()(const op::CreateElement& o) {
        return {true, adapter.adopt(adapter.document_.create_element(o.tag)), 0};
    }

    OpResult operator()(const op::CreateText& o) {
        return {true, adapter.adopt(adapter.document_.create_text_node(o.data)), 0};
    }

    OpResult operator()(const op::CreateMarker& o) {
        return {true, adapter.adopt(adapter.document_.create_comment(o.label)), 0};
    }

    OpResult operator()(const op::SetAttribute& o) {
        Element* element = as_element(o.node);
        if (!element) return {};
        element->set_attribute(o.name, o.value);
        return {true, o.node, 0};
    }

    OpResult operator()(const op::RemoveAttribute& o) {
        Element* element = as_element(o.node);
        if (!element) return {};
        // Absent attribute is already the requested state
        element->remove_attribute(o.name);
        return {true, o.node, 0};
    }

    OpResult operator()(const op::SetText& o) {
        Node* node = adapter.find(o.node);
        if (!node) return {};
        if (node->node_type() == NodeType::Text) {
            static_cast<Text*>(node)->set_data(o.data);
        } else if (node->node_type() == NodeType::Comment) {
            static_cast<Comment*>(node)->set_data(o.data);
        } else {
            return {};
        }
        return {true, o.node, 0};
    }

    OpResult operator()(const op::AddListener& o) {
        Node* node = adapter.find(o.node);
        if (!node) return {};
        ListenerId id = node->event_target().add_event_listener(o.type, o.listener, o.capture);
        return {true, o.node, id};
    }

    OpResult operator()(const op::RemoveListener& o) {
        Node* node = adapter.find(o.node);
        if (!node) return {};
        return {node->event_target().remove_event_listener(o.listener), o.node, o.listener};
    }

    OpResult operator()(const op::Insert& o) {
        Node* parent = adapter.find(o.parent);
        Node* node = adapter.find(o.node);
        if (!can_insert(parent, node)) return {};

        Node* before = nullptr;
        if (o.before != kNoNode) {
            before = adapter.find(o.before);
            if (!before || before == node || before->parent() != parent) return {};
        }

        parent->adopt(adapter.detach(*node), before);
        return {true, o.node, 0};
    }

    OpResult operator()(const op::InsertAfter& o) {
        Node* parent = adapter.find(o.parent);
        Node* node = adapter.find(o.node);
        Node* after = adapter.find(o.after);
        if (!can_insert(parent, node)) return {};
        if (!after || after == node || after->parent() != parent) return {};

        auto owned = adapter.detach(*node);
        parent->adopt(std::move(owned), after->next_sibling());
        return {true, o.node, 0};
    }

    OpResult operator()(const op::Remove& o) {
        Node* node = adapter.find(o.node);
        if (!node || o.node == adapter.root_) return {};
        auto owned = adapter.detach(*node);
        adapter.forget_subtree(*owned);
        return {true, o.node, 0};
    }

private:
    Element* as_element(NodeId id) {
        Node* node = adapter.find(id);
        if (!node || node->node_type() != NodeType::Element) return nullptr;
        return static_cast<Element*>(node);
    }

    bool can_insert(Node* parent, Node* node) {
        if (!parent || !node) return false;
        if (node->node_type() == NodeType::Document) return false;
        if (parent->node_type() == NodeType::Text || parent->node_type() == NodeType::Comment) return false;
        // No cycles: parent must not live inside node
        return !node->contains(*parent);
    }
};

// ---------------------------------------------------------------------------
// DocumentAdapter
// ---------------------------------------------------------------------------

namespace {

void collect_subtree(Node& node, std::vector<Node*>& out) {
    out.push_back(&node);
    node.for_each_child([&out](const Node& child) {
        collect_subtree(const_cast<Node&>(child), out);
    });
}

void escape_into(std::ostringstream& out, const std::string& text) {
    for (char c : text) {
        switch (c) {
            case '&': out << "&amp;"; break;
            case '<': out << "&lt;"; break;
            case '>': out << "&gt;"; break;
            case '"': out << "&quot;"; break;
            default:  out << c; break;
        }
    }
}

void serialize_into(std::ostringstream& out, const Node& node, bool include_markers) {
    switch (node.node_type()) {
        case NodeType::Text:
            escape_into(out, static_cast<const Text&>(node).data());
            return;
        case NodeType::Comment:
            if (include_markers) {
                out << "<!--" << static_cast<const Comment&>(node).data() << "-->";
            }
            return;
        case NodeType::Document:
            node.for_each_child([&](const Node& child) { serialize_into(out, child, include_markers); });
            return;
        case NodeType::Element:
            break;
    }

    const auto& element = static_cast<const Element&>(node);
    out << "<" << element.tag_name();
    for (const auto& attr : element.attributes()) {
        out << " " << attr.name << "=\"";
        escape_into(out, attr.value);
        out << "\"";
    }
    out << ">";
    node.for_each_child([&](const Node& child) { serialize_into(out, child, include_markers); });
    out << "</" << element.tag_name() << ">";
}

} // namespace

DocumentAdapter::DocumentAdapter(Document& document)
    : document_(document) {
    std::vector<Node*> existing;
    collect_subtree(document_, existing);
    for (Node* node : existing) {
        NodeId id = next_id_++;
        node->set_id(id);
        nodes_[id] = node;
    }
    root_ = document_.id();
}

DocumentAdapter::~DocumentAdapter() = default;

OpResult DocumentAdapter::apply(DomOp operation) {
    std::lock_guard lock(mutex_);
    OpResult result = std::visit(OperationApplier{*this}, operation);
    if (observer_) {
        observer_(operation, result);
    }
    return result;
}

void DocumentAdapter::set_observer(MutationObserver observer) {
    std::lock_guard lock(mutex_);
    observer_ = std::move(observer);
}

bool DocumentAdapter::dispatch(NodeId target, Event& event) {
    std::vector<DispatchStep> plan;
    {
        std::lock_guard lock(mutex_);
        Node* node = find(target);
        if (!node) return false;
        plan = plan_dispatch(event, *node);
    }
    return run_dispatch(event, target, plan);
}

bool DocumentAdapter::exists(NodeId node) const {
    std::lock_guard lock(mutex_);
    return find(node) != nullptr;
}

bool DocumentAdapter::is_attached(NodeId node) const {
    std::lock_guard lock(mutex_);
    Node* n = find(node);
    return n && document_.contains(*n);
}

std::vector<NodeId> DocumentAdapter::children(NodeId parent) const {
    std::lock_guard lock(mutex_);
    std::vector<NodeId> result;
    Node* node = find(parent);
    if (!node) return result;
    node->for_each_child([&result](const Node& child) { result.push_back(child.id()); });
    return result;
}

std::optional<NodeId> DocumentAdapter::parent_of(NodeId node) const {
    std::lock_guard lock(mutex_);
    Node* n = find(node);
    if (!n || !n->parent()) return std::nullopt;
    return n->parent()->id();
}

std::optional<std::string> DocumentAdapter::tag_name(NodeId node) const {
    std::lock_guard lock(mutex_);
    Node* n = find(node);
    if (!n || n->node_type() != NodeType::Element) return std::nullopt;
    return static_cast<Element*>(n)->tag_name();
}

std::optional<std::string> DocumentAdapter::attribute(NodeId node, const std::string& name) const {
    std::lock_guard lock(mutex_);
    Node* n = find(node);
    if (!n || n->node_type() != NodeType::Element) return std::nullopt;
    return static_cast<Element*>(n)->get_attribute(name);
}

std::string DocumentAdapter::text_content(NodeId node) const {
    std::lock_guard lock(mutex_);
    Node* n = find(node);
    return n ? n->text_content() : std::string();
}

size_t DocumentAdapter::listener_count(NodeId node, const std::string& type) const {
    std::lock_guard lock(mutex_);
    Node* n = find(node);
    return n ? n->event_target().listener_count(type) : 0;
}

size_t DocumentAdapter::node_count() const {
    std::lock_guard lock(mutex_);
    return nodes_.size();
}

std::string DocumentAdapter::serialize(NodeId node, bool inner, bool include_markers) const {
    std::lock_guard lock(mutex_);
    std::ostringstream out;
    Node* n = find(node);
    if (!n) return {};
    if (inner) {
        n->for_each_child([&](const Node& child) { serialize_into(out, child, include_markers); });
    } else {
        serialize_into(out, *n, include_markers);
    }
    return out.str();
}

Node* DocumentAdapter::find(NodeId node) const {
    auto it = nodes_.find(node);
    return it == nodes_.end() ? nullptr : it->second;
}

NodeId DocumentAdapter::adopt(std::unique_ptr<Node> node) {
    NodeId id = next_id_++;
    node->set_id(id);
    nodes_[id] = node.get();
    detached_[id] = std::move(node);
    return id;
}

void DocumentAdapter::forget_subtree(Node& node) {
    std::vector<Node*> subtree;
    collect_subtree(node, subtree);
    for (Node* n : subtree) {
        nodes_.erase(n->id());
        detached_.erase(n->id());
    }
}

std::unique_ptr<Node> DocumentAdapter::detach(Node& node) {
    if (node.parent()) {
        return node.parent()->release(node);
    }
    auto it = detached_.find(node.id());
    std::unique_ptr<Node> owned = std::move(it->second);
    detached_.erase(it);
    return owned;
}

} // namespace weft::dom

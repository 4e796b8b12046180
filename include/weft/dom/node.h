#pragma once
#include <weft/dom/event.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace weft::dom {

enum class NodeType {
    Element, Text, Comment, Document
};

// Tree node owned by a DocumentAdapter. A node either sits under its parent
// or is held detached by the adapter until it is inserted or removed.
class Node {
public:
    explicit Node(NodeType type);
    virtual ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    NodeType node_type() const { return type_; }
    Node* parent() const { return parent_; }
    Node* next_sibling() const;

    // Handle assigned by the owning DomAdapter (kNoNode if none)
    NodeId id() const { return id_; }
    void set_id(NodeId id) { id_ = id; }

    // Takes `child` in front of `before`, or last when `before` is null.
    // Throws std::invalid_argument if `before` is not a child of this node.
    Node& adopt(std::unique_ptr<Node> child, Node* before = nullptr);

    // Hands `child` back to the caller, unparented.
    // Throws std::invalid_argument if it is not a child of this node.
    std::unique_ptr<Node> release(Node& child);

    // Inclusive: a node contains itself.
    bool contains(const Node& other) const;

    template<typename Fn>
    void for_each_child(Fn&& fn) const {
        for (auto& child : children_) {
            fn(*child);
        }
    }

    EventTarget& event_target() { return events_; }
    const EventTarget& event_target() const { return events_; }

    virtual std::string text_content() const;

protected:
    std::vector<std::unique_ptr<Node>>::const_iterator find_child(const Node* child) const;

    NodeType type_;
    NodeId id_ = kNoNode;
    Node* parent_ = nullptr;
    std::vector<std::unique_ptr<Node>> children_;
    EventTarget events_;
};

} // namespace weft::dom

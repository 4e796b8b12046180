#include <weft/dom/node.h>

#include <algorithm>
#include <stdexcept>

namespace weft::dom {

Node::Node(NodeType type) : type_(type) {}

Node::~Node() = default;

std::vector<std::unique_ptr<Node>>::const_iterator Node::find_child(const Node* child) const {
    return std::find_if(children_.begin(), children_.end(),
        [child](const std::unique_ptr<Node>& c) { return c.get() == child; });
}

Node* Node::next_sibling() const {
    if (!parent_) return nullptr;
    auto it = parent_->find_child(this);
    if (it == parent_->children_.cend() || ++it == parent_->children_.cend()) {
        return nullptr;
    }
    return it->get();
}

Node& Node::adopt(std::unique_ptr<Node> child, Node* before) {
    if (!child) {
        throw std::invalid_argument("adopt: null child");
    }
    auto at = before ? find_child(before) : children_.cend();
    if (before && at == children_.cend()) {
        throw std::invalid_argument("adopt: reference node #" + std::to_string(before->id_) +
                                    " is not a child of #" + std::to_string(id_));
    }

    Node& adopted = *child;
    adopted.parent_ = this;
    children_.insert(at, std::move(child));
    return adopted;
}

std::unique_ptr<Node> Node::release(Node& child) {
    auto it = find_child(&child);
    if (it == children_.cend()) {
        throw std::invalid_argument("release: node #" + std::to_string(child.id_) +
                                    " is not a child of #" + std::to_string(id_));
    }

    auto owned = std::move(children_[it - children_.cbegin()]);
    children_.erase(it);
    owned->parent_ = nullptr;
    return owned;
}

bool Node::contains(const Node& other) const {
    for (const Node* n = &other; n; n = n->parent_) {
        if (n == this) return true;
    }
    return false;
}

std::string Node::text_content() const {
    std::string result;
    for (auto& child : children_) {
        result += child->text_content();
    }
    return result;
}

} // namespace weft::dom

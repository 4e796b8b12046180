#pragma once
#include <weft/dom/document.h>
#include <weft/dom/dom_ops.h>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace weft::dom {

struct OpResult {
    bool ok = false;
    NodeId node = kNoNode;       // created node, for Create* operations
    ListenerId listener = 0;     // for AddListener
};

// The only boundary through which the mounting layer touches a document.
// Operations naming a node that no longer exists fail with ok == false
// instead of touching freed memory.
class DomAdapter {
public:
    virtual ~DomAdapter() = default;

    virtual OpResult apply(DomOp operation) = 0;

    // Convenience wrappers over apply()
    NodeId create_element(const std::string& tag);
    NodeId create_text(const std::string& data);
    NodeId create_marker(const std::string& label);
    bool set_attribute(NodeId node, const std::string& name, const std::string& value);
    bool remove_attribute(NodeId node, const std::string& name);
    bool set_text(NodeId node, const std::string& data);
    ListenerId add_listener(NodeId node, const std::string& type,
                            EventTarget::EventListener listener, bool capture = false);
    bool remove_listener(NodeId node, ListenerId listener);
    bool insert(NodeId parent, NodeId node, NodeId before = kNoNode);
    bool insert_after(NodeId parent, NodeId node, NodeId after);
    bool remove(NodeId node);
};

// DomAdapter over an in-process Document. Every operation runs under one
// mutex; listeners are invoked outside of it.
class DocumentAdapter : public DomAdapter {
public:
    // Called under the adapter lock after each operation; must not call back
    // into the adapter.
    using MutationObserver = std::function<void(const DomOp&, const OpResult&)>;

    explicit DocumentAdapter(Document& document);
    ~DocumentAdapter() override;

    DocumentAdapter(const DocumentAdapter&) = delete;
    DocumentAdapter& operator=(const DocumentAdapter&) = delete;

    OpResult apply(DomOp operation) override;

    // Id of the document node itself
    NodeId root() const { return root_; }

    void set_observer(MutationObserver observer);

    // Dispatches capture -> target -> bubble. Returns false if the event is
    // unknown or its default action was prevented.
    bool dispatch(NodeId target, Event& event);

    // Read access, each a consistent snapshot
    bool exists(NodeId node) const;
    bool is_attached(NodeId node) const;
    std::vector<NodeId> children(NodeId parent) const;
    std::optional<NodeId> parent_of(NodeId node) const;
    std::optional<std::string> tag_name(NodeId node) const;
    std::optional<std::string> attribute(NodeId node, const std::string& name) const;
    std::string text_content(NodeId node) const;
    size_t listener_count(NodeId node, const std::string& type) const;
    size_t node_count() const;

    // Markup of the subtree under `node` (children only when inner is true).
    // Anchor comments are omitted unless include_markers is set.
    std::string serialize(NodeId node, bool inner = true, bool include_markers = false) const;

private:
    friend struct OperationApplier;

    Node* find(NodeId node) const;
    NodeId adopt(std::unique_ptr<Node> node);
    void forget_subtree(Node& node);
    std::unique_ptr<Node> detach(Node& node);

    mutable std::mutex mutex_;
    Document& document_;
    NodeId root_ = kNoNode;
    NodeId next_id_ = 1;
    std::unordered_map<NodeId, Node*> nodes_;
    // Created but not inserted anywhere yet
    std::unordered_map<NodeId, std::unique_ptr<Node>> detached_;
    MutationObserver observer_;
};

} // namespace weft::dom

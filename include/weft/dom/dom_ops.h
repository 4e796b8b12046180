#pragma once
#include <weft/dom/event.h>

#include <string>
#include <variant>

namespace weft::dom {

// The closed set of mutations the mounting layer performs on a document.
namespace op {

struct CreateElement {
    std::string tag;
};

struct CreateText {
    std::string data;
};

// Comment node used as an insertion anchor.
struct CreateMarker {
    std::string label;
};

struct SetAttribute {
    NodeId node = kNoNode;
    std::string name;
    std::string value;
};

struct RemoveAttribute {
    NodeId node = kNoNode;
    std::string name;
};

struct SetText {
    NodeId node = kNoNode;
    std::string data;
};

struct AddListener {
    NodeId node = kNoNode;
    std::string type;
    EventTarget::EventListener listener;
    bool capture = false;
};

struct RemoveListener {
    NodeId node = kNoNode;
    ListenerId listener = 0;
};

// Inserts `node` under `parent` before `before`, or last when before is kNoNode.
struct Insert {
    NodeId parent = kNoNode;
    NodeId node = kNoNode;
    NodeId before = kNoNode;
};

// Inserts `node` right after the child `after` of `parent`.
struct InsertAfter {
    NodeId parent = kNoNode;
    NodeId node = kNoNode;
    NodeId after = kNoNode;
};

// Detaches `node` and destroys it together with its subtree.
struct Remove {
    NodeId node = kNoNode;
};

} // namespace op

using DomOp = std::variant<op::CreateElement, op::CreateText, op::CreateMarker,
                           op::SetAttribute, op::RemoveAttribute, op::SetText,
                           op::AddListener, op::RemoveListener,
                           op::Insert, op::InsertAfter, op::Remove>;

const char* op_name(const DomOp& operation);

// One-line rendering, e.g. `set-attribute #4 title="b"`.
std::string describe(const DomOp& operation);

} // namespace weft::dom

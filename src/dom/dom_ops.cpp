#include <weft/dom/dom_ops.h>

#include <sstream>

namespace weft::dom {

namespace {

struct Describer {
    std::ostringstream& out;

    void operator()(const op::CreateElement& o) { out << "create-element <" << o.tag << ">"; }
    void operator()(const op::CreateText& o) { out << "create-text \"" << o.data << "\""; }
    void operator()(const op::CreateMarker& o) { out << "create-marker " << o.label; }
    void operator()(const op::SetAttribute& o) {
        out << "set-attribute #" << o.node << " " << o.name << "=\"" << o.value << "\"";
    }
    void operator()(const op::RemoveAttribute& o) { out << "remove-attribute #" << o.node << " " << o.name; }
    void operator()(const op::SetText& o) { out << "set-text #" << o.node << " \"" << o.data << "\""; }
    void operator()(const op::AddListener& o) {
        out << "add-listener #" << o.node << " " << o.type << (o.capture ? " capture" : "");
    }
    void operator()(const op::RemoveListener& o) {
        out << "remove-listener #" << o.node << " " << o.listener;
    }
    void operator()(const op::Insert& o) {
        out << "insert #" << o.node << " into #" << o.parent;
        if (o.before != kNoNode) out << " before #" << o.before;
    }
    void operator()(const op::InsertAfter& o) {
        out << "insert #" << o.node << " into #" << o.parent << " after #" << o.after;
    }
    void operator()(const op::Remove& o) { out << "remove #" << o.node; }
};

} // namespace

const char* op_name(const DomOp& operation) {
    switch (operation.index()) {
        case 0:  return "create-element";
        case 1:  return "create-text";
        case 2:  return "create-marker";
        case 3:  return "set-attribute";
        case 4:  return "remove-attribute";
        case 5:  return "set-text";
        case 6:  return "add-listener";
        case 7:  return "remove-listener";
        case 8:  return "insert";
        case 9:  return "insert-after";
        case 10: return "remove";
    }
    return "unknown";
}

std::string describe(const DomOp& operation) {
    std::ostringstream out;
    std::visit(Describer{out}, operation);
    return out.str();
}

} // namespace weft::dom

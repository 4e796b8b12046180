#include <weft/dom/document.h>

namespace weft::dom {

Document::Document() : Node(NodeType::Document) {}

std::unique_ptr<Element> Document::create_element(const std::string& tag) {
    return std::make_unique<Element>(tag);
}

std::unique_ptr<Text> Document::create_text_node(const std::string& data) {
    return std::make_unique<Text>(data);
}

std::unique_ptr<Comment> Document::create_comment(const std::string& data) {
    return std::make_unique<Comment>(data);
}

} // namespace weft::dom

#pragma once
#include <weft/dom/element.h>
#include <weft/dom/text.h>
#include <weft/dom/comment.h>

namespace weft::dom {

// Root of a DocumentAdapter's tree and factory for the nodes it adopts.
class Document : public Node {
public:
    Document();

    std::unique_ptr<Element> create_element(const std::string& tag);
    std::unique_ptr<Text> create_text_node(const std::string& data);
    std::unique_ptr<Comment> create_comment(const std::string& data);
};

} // namespace weft::dom

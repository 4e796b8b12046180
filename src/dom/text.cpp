#include <weft/dom/text.h>

namespace weft::dom {

Text::Text(const std::string& data)
    : Node(NodeType::Text)
    , data_(data) {}

std::string Text::text_content() const {
    return data_;
}

} // namespace weft::dom

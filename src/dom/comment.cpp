#include <weft/dom/comment.h>

namespace weft::dom {

Comment::Comment(const std::string& data)
    : Node(NodeType::Comment)
    , data_(data) {}

} // namespace weft::dom

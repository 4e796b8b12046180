#pragma once
#include <weft/dom/node.h>

namespace weft::dom {

// Comments double as invisible insertion anchors for dynamic content.
class Comment : public Node {
public:
    explicit Comment(const std::string& data);
    const std::string& data() const { return data_; }
    void set_data(const std::string& data) { data_ = data; }
private:
    std::string data_;
};

} // namespace weft::dom

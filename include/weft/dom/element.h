#pragma once
#include <weft/dom/node.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace weft::dom {

struct Attribute {
    std::string name;
    std::string value;
};

// Attributes keep the order in which they were first set; that order is
// the serialization order.
class Element : public Node {
public:
    explicit Element(const std::string& tag_name);

    const std::string& tag_name() const { return tag_name_; }

    std::optional<std::string> get_attribute(std::string_view name) const;
    // Returns false when the attribute already had `value`.
    bool set_attribute(const std::string& name, const std::string& value);
    // Returns false when there was nothing to remove.
    bool remove_attribute(const std::string& name);
    const std::vector<Attribute>& attributes() const { return attributes_; }

private:
    std::vector<Attribute>::iterator find(std::string_view name);

    std::string tag_name_;
    std::vector<Attribute> attributes_;
};

} // namespace weft::dom

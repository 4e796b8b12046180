#include <weft/dom/element.h>

#include <algorithm>

namespace weft::dom {

Element::Element(const std::string& tag_name)
    : Node(NodeType::Element)
    , tag_name_(tag_name) {}

std::vector<Attribute>::iterator Element::find(std::string_view name) {
    return std::find_if(attributes_.begin(), attributes_.end(),
        [name](const Attribute& attr) { return attr.name == name; });
}

std::optional<std::string> Element::get_attribute(std::string_view name) const {
    for (const auto& attr : attributes_) {
        if (attr.name == name) return attr.value;
    }
    return std::nullopt;
}

bool Element::set_attribute(const std::string& name, const std::string& value) {
    auto it = find(name);
    if (it == attributes_.end()) {
        attributes_.push_back({name, value});
        return true;
    }
    if (it->value == value) return false;
    it->value = value;
    return true;
}

bool Element::remove_attribute(const std::string& name) {
    auto it = find(name);
    if (it == attributes_.end()) return false;
    attributes_.erase(it);
    return true;
}

} // namespace weft::dom

#include "JsonPathElement.hpp"

#include <utility>

namespace JP {

JsonPathElement::JsonPathElement(JsonPathField field)
    : value{std::move(field)} {}

JsonPathElement::JsonPathElement(JsonPathIndex index) noexcept
    : value{index} {}

auto JsonPathElement::field(std::string_view name) -> JsonPathElement {
    return JsonPathElement{JsonPathField{std::string{name}}};
}

auto JsonPathElement::index(JsonPathIndex index) noexcept -> JsonPathElement {
    return JsonPathElement{index};
}

auto JsonPathElement::isField() const noexcept -> bool {
    return std::holds_alternative<JsonPathField>(this->value);
}

auto JsonPathElement::isIndex() const noexcept -> bool {
    return std::holds_alternative<JsonPathIndex>(this->value);
}

auto JsonPathElement::asField() const noexcept -> JsonPathField const* {
    return std::get_if<JsonPathField>(&this->value);
}

auto JsonPathElement::asIndex() const noexcept -> JsonPathIndex const* {
    return std::get_if<JsonPathIndex>(&this->value);
}

auto JsonPathElement::toString() const -> std::string {
    if (auto const* f = this->asField())
        return f->name;
    return std::get<JsonPathIndex>(this->value).toString();
}

} // namespace JP

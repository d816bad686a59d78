#pragma once
#include "path/JsonPathIndex.hpp"

#include <compare>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace JP {

struct JsonPathField {
    std::string name;

    auto operator<=>(JsonPathField const&) const = default;
};

class JsonPathElement {
public:
    JsonPathElement(JsonPathField field);
    JsonPathElement(JsonPathIndex index) noexcept;

    static auto field(std::string_view name) -> JsonPathElement;
    static auto index(JsonPathIndex index) noexcept -> JsonPathElement;

    [[nodiscard]] auto isField() const noexcept -> bool;
    [[nodiscard]] auto isIndex() const noexcept -> bool;

    // Null when the element is of the other kind.
    [[nodiscard]] auto asField() const noexcept -> JsonPathField const*;
    [[nodiscard]] auto asIndex() const noexcept -> JsonPathIndex const*;

    [[nodiscard]] auto toString() const -> std::string;

    template <typename Visitor>
    auto visit(Visitor&& visitor) const -> decltype(auto) {
        return std::visit(std::forward<Visitor>(visitor), this->value);
    }

    auto operator<=>(JsonPathElement const&) const = default;

private:
    std::variant<JsonPathField, JsonPathIndex> value;
};

} // namespace JP

#pragma once
#include "core/Error.hpp"
#include "path/JsonPathElement.hpp"
#include "path/PathView.hpp"
#include "path/validation.hpp"

#include <compare>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace JP {

/*
 * Parsed path expression, root to leaf. Grammar:
 *
 *   path    := '$' element* | digit+
 *   element := '.' field | '[' index ']'
 *   field   := alpha+
 *   index   := ('#' '-'?)? digit*
 *
 * A bare digit run is shorthand for a single root level array index. An empty
 * path addresses the root itself.
 */
class JsonPath {
public:
    using const_iterator = std::vector<JsonPathElement>::const_iterator;

    JsonPath() = default;
    explicit JsonPath(std::vector<JsonPathElement> elements);
    JsonPath(std::initializer_list<JsonPathElement> elements);

    static auto parse(std::string_view text, ValidationLevel level = ValidationLevel::Basic) -> Expected<JsonPath>;

    [[nodiscard]] auto elements() const noexcept -> std::vector<JsonPathElement> const&;
    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto empty() const noexcept -> bool;
    [[nodiscard]] auto last() const noexcept -> JsonPathElement const*;
    [[nodiscard]] auto view() const noexcept -> JsonPathView;

    auto begin() const noexcept -> const_iterator;
    auto end() const noexcept -> const_iterator;

    // Canonical text, e.g. "$.a[3][#-1]". Field names outside the grammar are
    // written as is and will not parse back to the same path.
    [[nodiscard]] auto toString() const -> std::string;

    auto operator<=>(JsonPath const&) const = default;
    auto operator==(JsonPath const&) const -> bool = default;

private:
    std::vector<JsonPathElement> elementList;
};

} // namespace JP

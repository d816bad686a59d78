#pragma once
#include "value/CompareOptions.hpp"

#include <compare>

#include <nlohmann/json.hpp>

namespace JP {

/*
 * Cross-type preorder over JSON values, first matching rule wins:
 *
 *   - deep equality is equivalent (two nulls included)
 *   - anything else involving null is unordered
 *   - bool < bool, number < number (int64, then uint64, then double), string < string
 *   - bool against number compares as 0.0 / 1.0
 *   - number against string compares numerically when the string parses as a
 *     double, otherwise the number is less
 *   - bool < number < string < containers across kinds
 *   - containers against containers follow CompareOptions::containers
 */
[[nodiscard]] auto partialCompare(nlohmann::json const& a, nlohmann::json const& b, CompareOptions const& options = {})
    -> std::partial_ordering;

// Borrowed value ordered by partialCompare, for sort, binary search and ordered containers.
class JsonValueRef {
public:
    JsonValueRef(nlohmann::json const& value) noexcept
        : value(&value) {}

    [[nodiscard]] auto get() const noexcept -> nlohmann::json const& {
        return *this->value;
    }
    auto operator*() const noexcept -> nlohmann::json const& {
        return *this->value;
    }
    auto operator->() const noexcept -> nlohmann::json const* {
        return this->value;
    }

    friend auto operator==(JsonValueRef const& lhs, JsonValueRef const& rhs) -> bool {
        return *lhs.value == *rhs.value;
    }
    friend auto operator<=>(JsonValueRef const& lhs, JsonValueRef const& rhs) -> std::partial_ordering {
        return partialCompare(*lhs.value, *rhs.value);
    }

private:
    nlohmann::json const* value;
};

} // namespace JP

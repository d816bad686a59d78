#pragma once
#include <compare>
#include <cstddef>
#include <optional>
#include <string>

namespace JP {

/*
 * Array position inside a path. FromStart counts from the front, FromEnd counts
 * backwards from the virtual end marker: FromEnd(0) is one past the last element
 * (append), FromEnd(1) the last element.
 */
struct JsonPathIndex {
    enum class Origin {
        FromStart = 0,
        FromEnd
    };

    Origin      origin = Origin::FromStart;
    std::size_t offset = 0;

    static constexpr auto fromStart(std::size_t n) noexcept -> JsonPathIndex {
        return JsonPathIndex{Origin::FromStart, n};
    }
    static constexpr auto fromEnd(std::size_t n) noexcept -> JsonPathIndex {
        return JsonPathIndex{Origin::FromEnd, n};
    }

    [[nodiscard]] constexpr auto isFromEnd() const noexcept -> bool {
        return this->origin == Origin::FromEnd;
    }
    [[nodiscard]] constexpr auto isAppendMarker() const noexcept -> bool {
        return this->origin == Origin::FromEnd && this->offset == 0;
    }

    // Absolute position in an array of the given size. FromEnd positions beyond
    // the front have no position; the result may still be == size.
    [[nodiscard]] constexpr auto position(std::size_t size) const noexcept -> std::optional<std::size_t> {
        if (this->origin == Origin::FromStart)
            return this->offset;
        if (this->offset > size)
            return std::nullopt;
        return size - this->offset;
    }

    [[nodiscard]] auto toString() const -> std::string {
        if (this->origin == Origin::FromStart)
            return std::to_string(this->offset);
        if (this->offset == 0)
            return "#";
        return "#-" + std::to_string(this->offset);
    }

    auto operator<=>(JsonPathIndex const&) const = default;
};

} // namespace JP

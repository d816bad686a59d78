#pragma once
#include "path/JsonPathElement.hpp"

#include <cstddef>
#include <iterator>
#include <span>

namespace JP {

// Borrowed window over the elements of a JsonPath. Never outlives the path.
struct JsonPathView {
    using Elements = std::span<JsonPathElement const>;

    JsonPathView() = default;
    JsonPathView(Elements elements) : current_(elements.begin()), end_(elements.end()) {}

    auto currentComponent() const -> JsonPathElement const& {
        return *current_;
    }
    auto isFinalComponent() const {
        return std::next(current_) == end_;
    }
    auto isAtEnd() const {
        return current_ == end_;
    }

    auto advance() -> JsonPathView& {
        ++current_;
        return *this;
    }

    auto next() const -> JsonPathView {
        JsonPathView p = *this;
        return p.advance();
    }

    auto size() const -> std::size_t {
        return static_cast<std::size_t>(end_ - current_);
    }
    auto empty() const -> bool {
        return current_ == end_;
    }

    auto current() const {
        return current_;
    }

    auto end() const {
        return end_;
    }

    // All remaining components but the last. Callers check empty() first.
    auto parent() const -> JsonPathView {
        return JsonPathView{Elements(current_, end_ - 1)};
    }
    auto last() const -> JsonPathElement const& {
        return *(end_ - 1);
    }

private:
    Elements::iterator current_{};
    Elements::iterator end_{};
};

} // namespace JP

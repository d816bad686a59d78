#include "ValueCompare.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace JP {

namespace {

using value_t = nlohmann::json::value_t;

// Comparison kinds in cross-kind order. Null never orders against anything.
enum class Kind {
    Null = 0,
    Bool,
    Number,
    String,
    Container
};

auto kindOf(nlohmann::json const& value) -> Kind {
    switch (value.type()) {
    case value_t::null:
    case value_t::discarded:
        return Kind::Null;
    case value_t::boolean:
        return Kind::Bool;
    case value_t::number_integer:
    case value_t::number_unsigned:
    case value_t::number_float:
        return Kind::Number;
    case value_t::string:
        return Kind::String;
    case value_t::array:
    case value_t::object:
    case value_t::binary:
        return Kind::Container;
    }
    return Kind::Null;
}

auto asInt64(nlohmann::json const& value) -> std::optional<std::int64_t> {
    switch (value.type()) {
    case value_t::number_integer:
        return value.get<std::int64_t>();
    case value_t::number_unsigned: {
        auto const u = value.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
            return std::nullopt;
        return static_cast<std::int64_t>(u);
    }
    default:
        return std::nullopt;
    }
}

auto asUint64(nlohmann::json const& value) -> std::optional<std::uint64_t> {
    switch (value.type()) {
    case value_t::number_unsigned:
        return value.get<std::uint64_t>();
    case value_t::number_integer: {
        auto const i = value.get<std::int64_t>();
        if (i < 0)
            return std::nullopt;
        return static_cast<std::uint64_t>(i);
    }
    default:
        return std::nullopt;
    }
}

auto asDouble(nlohmann::json const& value) -> std::optional<double> {
    if (!value.is_number())
        return std::nullopt;
    return value.get<double>();
}

// Whole-string float parse. A leading '+' is accepted, surrounding whitespace is not.
auto parseDouble(std::string const& text) -> std::optional<double> {
    std::string_view view{text};
    if (!view.empty() && view.front() == '+') {
        view.remove_prefix(1);
        if (!view.empty() && view.front() == '-')
            return std::nullopt;
    }
    if (view.empty())
        return std::nullopt;

    double     parsed = 0.0;
    auto const result = std::from_chars(view.data(), view.data() + view.size(), parsed);
    if (result.ptr != view.data() + view.size())
        return std::nullopt;
    if (result.ec == std::errc::result_out_of_range) {
        // Well-formed but beyond double range: strtod saturates to +-HUGE_VAL or flushes to zero
        std::string const bounded{view};
        return std::strtod(bounded.c_str(), nullptr);
    }
    if (result.ec != std::errc{})
        return std::nullopt;
    return parsed;
}

auto compareNumbers(nlohmann::json const& a, nlohmann::json const& b) -> std::partial_ordering {
    if (auto const ia = asInt64(a), ib = asInt64(b); ia && ib)
        return *ia <=> *ib;
    if (auto const ua = asUint64(a), ub = asUint64(b); ua && ub)
        return *ua <=> *ub;
    if (auto const da = asDouble(a), db = asDouble(b); da && db)
        return *da <=> *db;
    return std::partial_ordering::unordered;
}

auto footprint(nlohmann::json const& value) -> std::size_t {
    switch (value.type()) {
    case value_t::array:
        return sizeof(nlohmann::json::array_t);
    case value_t::object:
        return sizeof(nlohmann::json::object_t);
    case value_t::binary:
        return sizeof(nlohmann::json::binary_t);
    default:
        return 0;
    }
}

auto serializedLength(nlohmann::json const& value) -> std::size_t {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace).size();
}

auto compareContainers(nlohmann::json const& a, nlohmann::json const& b, CompareOptions const& options)
    -> std::partial_ordering {
    switch (options.containers) {
    case ContainerOrdering::Footprint:
        return footprint(a) <=> footprint(b);
    case ContainerOrdering::SerializedLength:
        return serializedLength(a) <=> serializedLength(b);
    }
    return std::partial_ordering::unordered;
}

// Values of different kinds, with kindOf(lower) < kindOf(higher) and neither null.
auto compareAcrossKinds(nlohmann::json const& lower, Kind lowerKind, nlohmann::json const& higher, Kind higherKind)
    -> std::partial_ordering {
    if (lowerKind == Kind::Bool && higherKind == Kind::Number) {
        double const flag = lower.get<bool>() ? 1.0 : 0.0;
        return flag <=> *asDouble(higher);
    }
    if (lowerKind == Kind::Number && higherKind == Kind::String) {
        auto const parsed = parseDouble(higher.get_ref<std::string const&>());
        if (parsed)
            return *asDouble(lower) <=> *parsed;
    }
    return std::partial_ordering::less;
}

} // namespace

auto partialCompare(nlohmann::json const& a, nlohmann::json const& b, CompareOptions const& options)
    -> std::partial_ordering {
    if (a == b)
        return std::partial_ordering::equivalent;

    auto const kindA = kindOf(a);
    auto const kindB = kindOf(b);
    if (kindA == Kind::Null || kindB == Kind::Null)
        return std::partial_ordering::unordered;

    if (kindA == kindB) {
        switch (kindA) {
        case Kind::Bool:
            return a.get<bool>() <=> b.get<bool>();
        case Kind::Number:
            return compareNumbers(a, b);
        case Kind::String:
            return a.get_ref<std::string const&>() <=> b.get_ref<std::string const&>();
        case Kind::Container:
            return compareContainers(a, b, options);
        case Kind::Null:
            break;
        }
        return std::partial_ordering::unordered;
    }

    if (kindA < kindB)
        return compareAcrossKinds(a, kindA, b, kindB);
    return 0 <=> compareAcrossKinds(b, kindB, a, kindA);
}

} // namespace JP

#include "Navigator.hpp"
#include "log/TaggedLogger.hpp"

#include <string>

namespace JP {

namespace {

// Json is nlohmann::json or nlohmann::json const
template <typename Json>
auto step(Json& current, JsonPathElement const& element) -> Json* {
    if (auto const* field = element.asField()) {
        if (!current.is_object())
            return nullptr;
        auto it = current.find(field->name);
        if (it == current.end())
            return nullptr;
        return &*it;
    }

    if (!current.is_array())
        return nullptr;
    auto const position = element.asIndex()->position(current.size());
    if (!position || *position >= current.size())
        return nullptr;
    return &current[*position];
}

template <typename Json>
auto walk(JsonPathView path, Json& root) -> Json* {
    Json* current = &root;
    for (; !path.isAtEnd(); path.advance()) {
        current = step(*current, path.currentComponent());
        if (current == nullptr)
            return nullptr;
    }
    return current;
}

auto unableToFind([[maybe_unused]] std::string_view expression) -> std::unexpected<Error> {
    jp_log("query found nothing at " + std::string(expression), "Navigator");
    return std::unexpected(Error{Error::Code::NotApplicable, std::string{kUnableToFindMessage}});
}

} // namespace

auto find(JsonPathView path, nlohmann::json const& root) -> nlohmann::json const* {
    return walk(path, root);
}

auto findMut(JsonPathView path, nlohmann::json& root) -> nlohmann::json* {
    return walk(path, root);
}

auto find(JsonPath const& path, nlohmann::json const& root) -> nlohmann::json const* {
    return walk(path.view(), root);
}

auto findMut(JsonPath const& path, nlohmann::json& root) -> nlohmann::json* {
    return walk(path.view(), root);
}

auto query(nlohmann::json const& root, std::string_view expression) -> Expected<nlohmann::json const*> {
    auto path = JsonPath::parse(expression);
    if (!path)
        return std::unexpected(path.error());
    if (auto const* value = find(*path, root))
        return value;
    return unableToFind(expression);
}

auto queryMut(nlohmann::json& root, std::string_view expression) -> Expected<nlohmann::json*> {
    auto path = JsonPath::parse(expression);
    if (!path)
        return std::unexpected(path.error());
    if (auto* value = findMut(*path, root))
        return value;
    return unableToFind(expression);
}

} // namespace JP

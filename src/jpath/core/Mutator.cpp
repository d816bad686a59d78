#include "Mutator.hpp"
#include "core/Navigator.hpp"
#include "log/TaggedLogger.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace JP {

namespace {

using value_t = nlohmann::json::value_t;

auto rejected([[maybe_unused]] MutationKind kind, [[maybe_unused]] JsonPath const& path) -> std::unexpected<Error> {
    jp_log(std::string(toString(kind)) + " not applicable at " + path.toString(), "Mutator");
    return std::unexpected(notApplicable());
}

// Container holding the final element; the root itself for single element paths.
auto resolveParent(JsonPath const& path, nlohmann::json& root) -> nlohmann::json* {
    return findMut(path.view().parent(), root);
}

// Position addressed by an index element in an array of the given size, or
// nullopt if the element is not an index or lies before the front.
auto arrayPosition(JsonPathElement const& element, std::size_t size) -> std::optional<std::size_t> {
    auto const* index = element.asIndex();
    if (index == nullptr)
        return std::nullopt;
    return index->position(size);
}

auto arrayIterator(nlohmann::json& array, std::size_t position) -> nlohmann::json::iterator {
    return array.begin() + static_cast<std::ptrdiff_t>(position);
}

} // namespace

auto toString(MutationKind kind) -> std::string_view {
    switch (kind) {
    case MutationKind::Insert:
        return "insert";
    case MutationKind::Replace:
        return "replace";
    case MutationKind::Set:
        return "set";
    case MutationKind::Remove:
        return "remove";
    }
    return "unknown";
}

auto insert(JsonPath const& path, nlohmann::json& root, nlohmann::json value) -> Expected<nlohmann::json*> {
    if (path.empty())
        return rejected(MutationKind::Insert, path);
    auto* parent = resolveParent(path, root);
    if (parent == nullptr)
        return rejected(MutationKind::Insert, path);

    auto const& last = *path.last();
    switch (parent->type()) {
    case value_t::array: {
        auto const position = arrayPosition(last, parent->size());
        if (!position || *position > parent->size())
            break;
        parent->insert(arrayIterator(*parent, *position), std::move(value));
        return &root;
    }
    case value_t::object: {
        auto const* field = last.asField();
        if (field == nullptr || parent->contains(field->name))
            break;
        parent->emplace(field->name, std::move(value));
        return &root;
    }
    default:
        break;
    }
    return rejected(MutationKind::Insert, path);
}

auto replace(JsonPath const& path, nlohmann::json& root, nlohmann::json value) -> Expected<nlohmann::json*> {
    auto* target = findMut(path, root);
    if (target == nullptr)
        return rejected(MutationKind::Replace, path);
    *target = std::move(value);
    return &root;
}

auto set(JsonPath const& path, nlohmann::json& root, nlohmann::json value) -> Expected<nlohmann::json*> {
    if (path.empty())
        return rejected(MutationKind::Set, path);
    auto* parent = resolveParent(path, root);
    if (parent == nullptr)
        return rejected(MutationKind::Set, path);

    auto const& last = *path.last();
    switch (parent->type()) {
    case value_t::array: {
        // FromEnd(0) maps to size and is refused along with everything past the end
        auto const position = arrayPosition(last, parent->size());
        if (!position || *position >= parent->size())
            break;
        (*parent)[*position] = std::move(value);
        return &root;
    }
    case value_t::object: {
        auto const* field = last.asField();
        if (field == nullptr)
            break;
        (*parent)[field->name] = std::move(value);
        return &root;
    }
    default:
        break;
    }
    return rejected(MutationKind::Set, path);
}

auto remove(JsonPath const& path, nlohmann::json& root) -> Expected<nlohmann::json*> {
    if (path.empty())
        return rejected(MutationKind::Remove, path);
    auto* parent = resolveParent(path, root);
    if (parent == nullptr)
        return rejected(MutationKind::Remove, path);

    auto const& last = *path.last();
    switch (parent->type()) {
    case value_t::array: {
        auto const position = arrayPosition(last, parent->size());
        if (!position || *position >= parent->size())
            break;
        parent->erase(arrayIterator(*parent, *position));
        return &root;
    }
    case value_t::object: {
        auto const* field = last.asField();
        if (field == nullptr)
            break;
        auto it = parent->find(field->name);
        if (it == parent->end())
            break;
        parent->erase(it);
        return &root;
    }
    default:
        break;
    }
    return rejected(MutationKind::Remove, path);
}

auto mutate(MutationKind kind, JsonPath const& path, nlohmann::json& root, nlohmann::json value) -> Expected<nlohmann::json*> {
    switch (kind) {
    case MutationKind::Insert:
        return insert(path, root, std::move(value));
    case MutationKind::Replace:
        return replace(path, root, std::move(value));
    case MutationKind::Set:
        return set(path, root, std::move(value));
    case MutationKind::Remove:
        return remove(path, root);
    }
    return rejected(kind, path);
}

} // namespace JP

#pragma once
#include "core/Error.hpp"
#include "path/JsonPath.hpp"

#include <string_view>

#include <nlohmann/json.hpp>

namespace JP {

enum class MutationKind {
    Insert = 0,
    Replace,
    Set,
    Remove
};

[[nodiscard]] auto toString(MutationKind kind) -> std::string_view;

/*
 * Tree mutations addressed by a path. insert, set and remove resolve the parent
 * of the final element and apply the final element to it:
 *
 *              array + FromStart(i)   array + FromEnd(i)       object + Field(key)
 *   insert     i <= size              i <= size (0 appends)    key must be absent
 *   set        i < size               1 <= i <= size           always
 *   remove     i < size               1 <= i <= size           key must be present
 *
 * replace resolves the whole path and overwrites only an existing value.
 *
 * On success the root is returned. Every other case is NotApplicable, and a
 * failed call leaves the tree exactly as it was.
 */
[[nodiscard]] auto insert(JsonPath const& path, nlohmann::json& root, nlohmann::json value) -> Expected<nlohmann::json*>;
[[nodiscard]] auto replace(JsonPath const& path, nlohmann::json& root, nlohmann::json value) -> Expected<nlohmann::json*>;
[[nodiscard]] auto set(JsonPath const& path, nlohmann::json& root, nlohmann::json value) -> Expected<nlohmann::json*>;
[[nodiscard]] auto remove(JsonPath const& path, nlohmann::json& root) -> Expected<nlohmann::json*>;

// Runtime selected mutation. value is ignored for Remove.
[[nodiscard]] auto mutate(MutationKind kind, JsonPath const& path, nlohmann::json& root, nlohmann::json value = nullptr)
    -> Expected<nlohmann::json*>;

} // namespace JP

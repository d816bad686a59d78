#pragma once
#include "core/Error.hpp"
#include "path/JsonPath.hpp"
#include "path/PathView.hpp"

#include <string_view>

#include <nlohmann/json.hpp>

namespace JP {

/*
 * Resolves a path against a value tree, one element at a time. Fields need an
 * object holding the key, indices need an array holding the position; anything
 * else stops the walk and yields nullptr. FromEnd(0) never resolves here since
 * it names the slot one past the last element.
 */
[[nodiscard]] auto find(JsonPathView path, nlohmann::json const& root) -> nlohmann::json const*;
[[nodiscard]] auto findMut(JsonPathView path, nlohmann::json& root) -> nlohmann::json*;

[[nodiscard]] auto find(JsonPath const& path, nlohmann::json const& root) -> nlohmann::json const*;
[[nodiscard]] auto findMut(JsonPath const& path, nlohmann::json& root) -> nlohmann::json*;

// Parse and resolve in one go. SyntaxError from the parser is passed through,
// an unresolved path is NotApplicable.
[[nodiscard]] auto query(nlohmann::json const& root, std::string_view expression) -> Expected<nlohmann::json const*>;
[[nodiscard]] auto queryMut(nlohmann::json& root, std::string_view expression) -> Expected<nlohmann::json*>;

} // namespace JP

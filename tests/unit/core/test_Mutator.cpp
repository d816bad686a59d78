#include "core/Mutator.hpp"
#include "core/Navigator.hpp"
#include "path/JsonPath.hpp"

#include <doctest/doctest.h>
#include <nlohmann/json.hpp>

#include <optional>
#include <string_view>
#include <vector>

using namespace JP;
using nlohmann::json;

namespace {

auto mustParse(std::string_view text) -> JsonPath {
    auto parsed = JsonPath::parse(text);
    REQUIRE(parsed.has_value());
    return *parsed;
}

struct MutationCase {
    std::string_view    path;
    char const*         before;
    json                value;
    std::optional<char const*> after; // nullopt: not applicable, tree untouched
};

void runCases(MutationKind kind, std::vector<MutationCase> const& cases) {
    for (auto const& c : cases) {
        CAPTURE(toString(kind));
        CAPTURE(c.path);
        CAPTURE(c.before);

        json const original = json::parse(c.before);
        json       tree     = original;
        auto       result   = mutate(kind, mustParse(c.path), tree, c.value);

        if (c.after) {
            REQUIRE(result.has_value());
            CHECK(*result == &tree);
            CHECK(tree == json::parse(*c.after));
        } else {
            REQUIRE_FALSE(result.has_value());
            CHECK(result.error().code == Error::Code::NotApplicable);
            CHECK(result.error().message == std::optional<std::string>{"not applicable"});
            CHECK(tree == original);
            CHECK(tree.dump() == original.dump());
        }
    }
}

} // namespace

TEST_SUITE("core.mutator") {

TEST_CASE("insert") {
    runCases(MutationKind::Insert,
             {
                     // object field, absent key only
                     {"$.a", "{}", "test", R"({"a":"test"})"},
                     {"$.a", R"({"a":10.0})", "test", std::nullopt},
                     {"$.a.b", R"({"a":{"c":1}})", 2, R"({"a":{"c":1,"b":2}})"},
                     // array FromStart, i <= size
                     {"$.a.b[1]", R"({"a":{"b":[1,2,4]}})", "test", R"({"a":{"b":[1,"test",2,4]}})"},
                     {"$.a.b[0]", R"({"a":{"b":[1,2,4]}})", "test", R"({"a":{"b":["test",1,2,4]}})"},
                     {"$.a.b[3]", R"({"a":{"b":[1,2,4]}})", "test", R"({"a":{"b":[1,2,4,"test"]}})"},
                     {"$.a.b[4]", R"({"a":{"b":[1,2,4]}})", "test", std::nullopt},
                     {"$.a[1]", R"({"a":[]})", "test", std::nullopt},
                     {"$.a[0]", R"({"a":[]})", "test", R"({"a":["test"]})"},
                     // array FromEnd, i <= size, inserted at size - i
                     {"$.a.b[#]", R"({"a":{"b":[1,2,4]}})", "test", R"({"a":{"b":[1,2,4,"test"]}})"},
                     {"$.a.b[#-1]", R"({"a":{"b":[1,2,4]}})", "test", R"({"a":{"b":[1,2,"test",4]}})"},
                     {"$.a.b[#-3]", R"({"a":{"b":[1,2,4]}})", "test", R"({"a":{"b":["test",1,2,4]}})"},
                     {"$.a.b[#-4]", R"({"a":{"b":[1,2,4]}})", "test", std::nullopt},
                     {"$.a[#-3]", R"({"a":[]})", "test", std::nullopt},
                     {"$.a[#]", R"({"a":[]})", "test", R"({"a":["test"]})"},
                     // root level
                     {"$[#]", "[1]", 2, "[1,2]"},
                     {"0", "[1]", 0, "[0,1]"},
                     // type mismatches and missing parents
                     {"$.a[0]", R"({"a":{}})", 1, std::nullopt},
                     {"$.a.x", R"({"a":[]})", 1, std::nullopt},
                     {"$.a.x", R"({"a":"str"})", 1, std::nullopt},
                     {"$.missing.x", R"({"a":{}})", 1, std::nullopt},
                     {"$.a[5].x", R"({"a":[{}]})", 1, std::nullopt},
                     {"$", "{}", 1, std::nullopt},
             });
}

TEST_CASE("replace") {
    runCases(MutationKind::Replace,
             {
                     {"$.a", R"({"a":1})", "new", R"({"a":"new"})"},
                     {"$.a", "{}", "new", std::nullopt},
                     {"$.a.b[1]", R"({"a":{"b":[1,2,4]}})", "x", R"({"a":{"b":[1,"x",4]}})"},
                     {"$.a.b[#-1]", R"({"a":{"b":[1,2,4]}})", "x", R"({"a":{"b":[1,2,"x"]}})"},
                     {"$.a.b[3]", R"({"a":{"b":[1,2,4]}})", "x", std::nullopt},
                     {"$.a.b[#]", R"({"a":{"b":[1,2,4]}})", "x", std::nullopt},
                     {"$.a.b[#-4]", R"({"a":{"b":[1,2,4]}})", "x", std::nullopt},
                     {"$.a.c.d", R"({"a":{"b":[1,2,4]}})", "x", std::nullopt},
                     {"$", R"({"a":1})", json::array({1, 2}), "[1,2]"},
             });
}

TEST_CASE("set") {
    runCases(MutationKind::Set,
             {
                     // object field, always
                     {"$.a", "{}", "v", R"({"a":"v"})"},
                     {"$.a", R"({"a":1})", "v", R"({"a":"v"})"},
                     // array FromStart, i < size
                     {"$[0]", "[1,2,3]", "v", R"(["v",2,3])"},
                     {"$[2]", "[1,2,3]", "v", R"([1,2,"v"])"},
                     {"$[3]", "[1,2,3]", "v", std::nullopt},
                     {"$[0]", "[]", "v", std::nullopt},
                     // array FromEnd, 1 <= i <= size
                     {"$[#-1]", "[1,2,3]", "v", R"([1,2,"v"])"},
                     {"$[#-3]", "[1,2,3]", "v", R"(["v",2,3])"},
                     {"$[#]", "[1,2,3]", "v", std::nullopt},
                     {"$[#-4]", "[1,2,3]", "v", std::nullopt},
                     // mismatches
                     {"$.a", "[1]", "v", std::nullopt},
                     {"$[0]", R"({"0":1})", "v", std::nullopt},
                     {"$.a.b", R"({"a":null})", "v", std::nullopt},
                     {"$", "{}", "v", std::nullopt},
             });
}

TEST_CASE("remove") {
    runCases(MutationKind::Remove,
             {
                     // object field, must be present
                     {"$.a", R"({"a":1,"b":2})", nullptr, R"({"b":2})"},
                     {"$.c", R"({"a":1,"b":2})", nullptr, std::nullopt},
                     // array FromStart, i < size
                     {"$[0]", "[1,2,3]", nullptr, "[2,3]"},
                     {"$[2]", "[1,2,3]", nullptr, "[1,2]"},
                     {"$[3]", "[1,2,3]", nullptr, std::nullopt},
                     // array FromEnd, 1 <= i <= size
                     {"$[#-1]", "[1,2,3]", nullptr, "[1,2]"},
                     {"$[#-3]", "[1,2,3]", nullptr, "[2,3]"},
                     {"$[#]", "[1,2,3]", nullptr, std::nullopt},
                     {"$[#-4]", "[1,2,3]", nullptr, std::nullopt},
                     // nested and mismatched
                     {"$.a.b[1]", R"({"a":{"b":[1,2,4]}})", nullptr, R"({"a":{"b":[1,4]}})"},
                     {"$.a[0]", R"({"a":{"0":1}})", nullptr, std::nullopt},
                     {"$.x.y", R"({"a":1})", nullptr, std::nullopt},
                     {"$", "[1]", nullptr, std::nullopt},
             });
}

TEST_CASE("insert then find at the same index") {
    for (std::size_t size = 0; size < 4; ++size) {
        for (std::size_t i = 0; i <= size; ++i) {
            CAPTURE(size);
            CAPTURE(i);
            json tree = json::array();
            for (std::size_t n = 0; n < size; ++n)
                tree.push_back(n);

            JsonPath const path{JsonPathElement::index(JsonPathIndex::fromStart(i))};
            REQUIRE(insert(path, tree, "inserted").has_value());
            CHECK(tree.size() == size + 1);

            auto const* found = find(path, tree);
            REQUIRE(found != nullptr);
            CHECK(*found == "inserted");
        }
    }
}

TEST_CASE("append marker always appends") {
    for (auto const* text : {"[]", "[1]", "[1,2,3]"}) {
        CAPTURE(text);
        json tree = json::parse(text);
        auto const size = tree.size();
        REQUIRE(insert(mustParse("$[#]"), tree, "end").has_value());
        CHECK(tree.size() == size + 1);
        CHECK(tree.back() == "end");
    }
}

TEST_CASE("set overwrites where insert refuses") {
    json tree = json::parse(R"({"k":1})");
    auto const path = mustParse("$.k");

    CHECK_FALSE(JP::insert(path, tree, 2).has_value());
    CHECK(tree["k"] == 1);
    CHECK(JP::set(path, tree, 2).has_value());
    CHECK(tree["k"] == 2);
}

TEST_CASE("replace never creates slots") {
    json tree = json::parse(R"({"a":[1]})");
    for (auto const* text : {"$.b", "$.a[1]", "$.a[#]", "$.a[0].x"}) {
        CAPTURE(text);
        CHECK_FALSE(JP::replace(mustParse(text), tree, 0).has_value());
    }
    CHECK(tree == json::parse(R"({"a":[1]})"));
}

TEST_CASE("direct calls match mutate dispatch") {
    json tree = json::parse(R"({"list":[1,2,3]})");

    REQUIRE(JP::insert(mustParse("$.list[#]"), tree, 4).has_value());
    REQUIRE(JP::set(mustParse("$.list[0]"), tree, 0).has_value());
    REQUIRE(JP::replace(mustParse("$.list[#-1]"), tree, 40).has_value());
    REQUIRE(JP::remove(mustParse("$.list[1]"), tree).has_value());
    CHECK(tree == json::parse(R"({"list":[0,3,40]})"));

    auto root = mutate(MutationKind::Remove, mustParse("$.list"), tree);
    REQUIRE(root.has_value());
    CHECK(**root == json::object());
}

TEST_CASE("mutation kind names") {
    CHECK(toString(MutationKind::Insert) == "insert");
    CHECK(toString(MutationKind::Replace) == "replace");
    CHECK(toString(MutationKind::Set) == "set");
    CHECK(toString(MutationKind::Remove) == "remove");
}

}

#include <jpath/core/Mutator.hpp>
#include <jpath/core/Navigator.hpp>
#include <jpath/path/JsonPath.hpp>
#include <jpath/value/ValueCompare.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

using namespace JP;

int main() {
    auto document = nlohmann::json::parse(R"({"inventory": {"items": ["bolt", "nut"], "count": 2}})");

    auto path = JsonPath::parse("$.inventory.items[#]");
    if (!path) {
        std::cerr << describeError(path.error()) << '\n';
        return 1;
    }

    if (auto inserted = insert(*path, document, "washer"); !inserted) {
        std::cerr << describeError(inserted.error()) << '\n';
        return 1;
    }
    if (auto count = JsonPath::parse("$.inventory.count"); count) {
        if (auto updated = set(*count, document, 3); !updated) {
            std::cerr << describeError(updated.error()) << '\n';
            return 1;
        }
    }

    // Fails: the array has no fifth element and set never appends
    if (auto fifth = JsonPath::parse("$.inventory.items[4]"); fifth) {
        auto result = set(*fifth, document, "spring");
        std::cout << path->toString() << " -> " << document.dump() << '\n';
        std::cout << fifth->toString() << " -> " << (result ? "ok" : describeError(result.error())) << '\n';
    }

    if (auto last = query(document, "$.inventory.items[#-1]"); last)
        std::cout << "last item: " << (*last)->dump() << '\n';

    auto const& items = document["inventory"]["items"];
    std::vector<JsonValueRef> ordered(items.begin(), items.end());
    std::sort(ordered.begin(), ordered.end());
    for (auto const& item : ordered)
        std::cout << item->get<std::string>() << ' ';
    std::cout << '\n';
    return 0;
}

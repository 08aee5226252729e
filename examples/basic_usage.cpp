// Basic TagFusion usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -lyyjson -o basic_usage

#include <TagFusion/error_formatting.hpp>
#include <TagFusion/registry.hpp>
#include <TagFusion/yyjson_tree.hpp>
#include <cstdint>
#include <iostream>
#include <string>
#include <type_traits>

using namespace TagFusion;

struct Complex {
    std::uint64_t a;
    std::uint64_t b;
};

static constexpr auto resources = *BuildRegistry(
    TaggedCase<"Number", std::uint64_t>{},
    TaggedCase<"String", std::string>{},
    TaggedCase<"Complex", Complex>{},
    Fallback<Value>{});

using Resource = TaggedUnion<std::remove_cvref_t<decltype(resources)>>;

void describe(const char * json) {
    Resource resource;
    auto result = DispatchJson(resource, json, "resourceType", "resource", resources);

    if (!result) {
        std::cout << "Error: " << DispatchResultToString(result) << std::endl;
        return;
    }

    if (resource.is_fallback()) {
        std::string raw;
        if (!WriteJson(resource.get<3>(), raw)) {
            std::cout << "Unknown resource (not printable)" << std::endl;
            return;
        }
        std::cout << "Unknown resource: " << raw << std::endl;
        return;
    }

    std::cout << resource.tag() << ": ";
    switch (resource.index()) {
    case 0: std::cout << resource.get<0>(); break;
    case 1: std::cout << resource.get<1>(); break;
    case 2: std::cout << "a=" << resource.get<2>().a << " b=" << resource.get<2>().b; break;
    }
    std::cout << std::endl;
}

int main() {
    describe(R"({"resourceType": "Number", "resource": 2000})");
    describe(R"({"resourceType": "Complex", "resource": {"a": 2000, "b": 5}})");
    describe(R"({"resourceType": "SomethingElse", "resource": {"c": 4000}})");

    // The tag matches, so the missing field is reported instead of falling back
    describe(R"({"resourceType": "Complex", "resource": {"a": 2000}})");

    return 0;
}

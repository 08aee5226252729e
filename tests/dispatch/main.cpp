#include <cassert>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <variant>

#include <TagFusion/adjacently_tagged.hpp>
#include <TagFusion/dispatcher.hpp>
#include <TagFusion/error_formatting.hpp>
#include <TagFusion/registry.hpp>
#include "../constexpr/test_helpers.hpp"

using namespace TagFusion;
using namespace TestHelpers;

struct Complex {
    std::uint64_t a;
    std::uint64_t b;
};

struct Note {
    std::string text;
    std::optional<std::string> author;
};

ParseResult always_five(std::uint32_t & out, const Value *) {
    out = 5;
    return ParseResult::success();
}

ParseResult positive_only(std::int64_t & out, const Value * v) {
    ParseResult r = DecodeField(out, v);
    if(r && out <= 0) {
        return ParseResult(ParseError::TRANSFORMER_ERROR, path::Path{}, "expected a positive number");
    }
    return r;
}

static constexpr auto resources = *BuildRegistry(
    TaggedCase<"Number", std::uint64_t>{},
    TaggedCase<"String", std::string>{},
    TaggedCase<"Complex", Complex>{},
    Fallback<Value>{});
using Resources = std::remove_cvref_t<decltype(resources)>;

static constexpr auto resourcesWithoutFallback = *BuildRegistry(
    TaggedCase<"Number", std::uint64_t>{},
    TaggedCase<"String", std::string>{},
    TaggedCase<"Complex", Complex>{});

static constexpr auto strictResources = *BuildRegistry(
    OptionsPack<options::strict_tag_type>{},
    TaggedCase<"Number", std::uint64_t>{},
    Fallback<Value>{});

static constexpr auto renamed = *BuildRegistry(
    TaggedCase<"string", std::string>{},
    Fallback<Value>{});

static constexpr auto customDecoders = *BuildRegistry(
    TaggedCase<"Number", std::uint32_t, always_five>{},
    TaggedCase<"Positive", std::int64_t, positive_only>{},
    Fallback<Value>{});

// Fallback that only accepts objects carrying a "kind" string.
struct Labeled {
    std::string kind;
};
static constexpr auto labeledFallback = *BuildRegistry(
    TaggedCase<"Number", std::uint64_t>{},
    Fallback<Annotated<Labeled, options::allow_excess_fields>>{});

static constexpr auto noCases = *BuildRegistry();
static constexpr auto fallbackOnly = *BuildRegistry(Fallback<Value>{});

static constexpr auto notes = *BuildRegistry(
    TaggedCase<"Note", Note>{},
    TaggedCase<"Empty", std::optional<Note>>{});

struct Shape {
    std::string id;
    AdjacentlyTagged<"kind", "data",
        TaggedCase<"point", Complex>,
        TaggedCase<"count", std::uint64_t>> body;
};

static constexpr std::string_view TAG = "resourceType";
static constexpr std::string_view CONTENT = "resource";

int main() {
    std::cout << "=== Dispatch Tests ===\n\n";

    // Test 1: Every registered tag selects its case
    {
        std::cout << "Test 1: Selector correctness... ";
        TaggedUnion<Resources> out;
        assert(!out.has_value());

        assert(DispatchSelects(out, Value::object({{"resourceType", "Number"}, {"resource", 2000}}),
                               TAG, CONTENT, resources, 0));
        assert(out.get<0>() == 2000 && out.tag() == "Number" && !out.is_fallback());

        assert(DispatchSelects(out, Value::object({{"resourceType", "String"}, {"resource", "text"}}),
                               TAG, CONTENT, resources, 1));
        assert(out.get<1>() == "text");

        assert(DispatchSelects(out, Value::object({{"resourceType", "Complex"},
                                                   {"resource", Value::object({{"a", 2000}, {"b", 3000}})}}),
                               TAG, CONTENT, resources, 2));
        assert(out.get<2>().a == 2000 && out.get<2>().b == 3000);
        assert(out.get_if<0>() == nullptr);
        std::cout << "PASSED\n";
    }

    // Test 2: A matched case with invalid content never falls back
    {
        std::cout << "Test 2: No silent fallback on content error... ";
        TaggedUnion<Resources> out;
        Value raw = Value::object({{"resourceType", "Complex"}, {"resource", Value::object({{"a", 2000}})}});
        auto r = Dispatch(out, raw, TAG, CONTENT, resources);
        assert(!r);
        assert(r.error() == DispatchError::CONTENT_INVALID);
        assert(r.variant_index() == Resources::find_tag("Complex"));
        assert(r.tag_value() == "Complex");
        assert(r.inner().error() == ParseError::MISSING_FIELD);
        assert(r.inner().errorPath().to_string() == "$.resource.b");
        assert(!out.has_value());

        Value wrongType = Value::object({{"resourceType", "Number"}, {"resource", "2000"}});
        r = Dispatch(out, wrongType, TAG, CONTENT, resources);
        assert(r.error() == DispatchError::CONTENT_INVALID);
        assert(r.inner().error() == ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE);
        std::cout << "PASSED (" << DispatchResultToString(r) << ")\n";
    }

    // Test 3: Unknown tag goes to the fallback with the whole input
    {
        std::cout << "Test 3: Fallback on unknown tag... ";
        TaggedUnion<Resources> out;
        Value raw = Value::object({
            {"unrelated", 1234},
            {"resourceType", "NotARegisteredTag"},
            {"resource", Value::object({{"d", 5000}})}
        });
        assert(DispatchSelects(out, raw, TAG, CONTENT, resources, Resources::fallback_index));
        assert(out.is_fallback());
        assert(out.tag().empty());
        assert(out.get<3>() == raw);
        std::cout << "PASSED\n";
    }

    // Test 4: Unknown tag without fallback lists the known tags
    {
        std::cout << "Test 4: Unknown tag without fallback... ";
        using NoFallback = std::remove_cvref_t<decltype(resourcesWithoutFallback)>;
        TaggedUnion<NoFallback> out;
        Value raw = Value::object({{"resourceType", "NotARegisteredTag"}, {"resource", 1}});
        auto r = Dispatch(out, raw, TAG, CONTENT, resourcesWithoutFallback);
        assert(r.error() == DispatchError::UNKNOWN_VARIANT);
        assert(r.tag_value() == "NotARegisteredTag");
        assert(r.known_tags().size() == 3);
        assert(r.known_tags()[0] == "Number" && r.known_tags()[1] == "String" && r.known_tags()[2] == "Complex");
        assert(DispatchResultToString(r) ==
               "UNKNOWN_VARIANT: \"NotARegisteredTag\", known tags: [\"Number\", \"String\", \"Complex\"]");
        std::cout << "PASSED\n";
    }

    // Test 5: Selector failures, with and without fallback
    {
        std::cout << "Test 5: Selector failures... ";
        using NoFallback = std::remove_cvref_t<decltype(resourcesWithoutFallback)>;
        TaggedUnion<NoFallback> strictOut;
        TaggedUnion<Resources> out;

        Value notAMap = Value::array({1, 2});
        auto r = Dispatch(strictOut, notAMap, TAG, CONTENT, resourcesWithoutFallback);
        assert(r.error() == DispatchError::NOT_A_MAPPING && r.found_kind() == ValueKind::Array);
        assert(DispatchSelects(out, notAMap, TAG, CONTENT, resources, 3) && out.get<3>() == notAMap);

        Value noTag = Value::object({{"resource", 1}});
        r = Dispatch(strictOut, noTag, TAG, CONTENT, resourcesWithoutFallback);
        assert(r.error() == DispatchError::MISSING_TAG_FIELD && r.tag_field() == "resourceType");
        assert(DispatchSelects(out, noTag, TAG, CONTENT, resources, 3));

        Value numericTag = Value::object({{"resourceType", 7}, {"resource", 1}});
        r = Dispatch(strictOut, numericTag, TAG, CONTENT, resourcesWithoutFallback);
        assert(r.error() == DispatchError::TAG_NOT_A_STRING && r.found_kind() == ValueKind::UInt);
        assert(DispatchSelects(out, numericTag, TAG, CONTENT, resources, 3));

        assert(DispatchFailsWith(strictOut, Value(nullptr), TAG, CONTENT, resourcesWithoutFallback,
                                 DispatchError::NOT_A_MAPPING));
        std::cout << "PASSED\n";
    }

    // Test 6: Strict tag type reports non-string tags even with a fallback
    {
        std::cout << "Test 6: Strict tag type... ";
        using Strict = std::remove_cvref_t<decltype(strictResources)>;
        TaggedUnion<Strict> out;
        Value numericTag = Value::object({{"resourceType", 7}, {"resource", 1}});
        auto r = Dispatch(out, numericTag, TAG, CONTENT, strictResources);
        assert(r.error() == DispatchError::TAG_NOT_A_STRING);
        assert(!out.has_value());

        Value unknown = Value::object({{"resourceType", "Other"}});
        assert(DispatchSelects(out, unknown, TAG, CONTENT, strictResources, 1));
        std::cout << "PASSED\n";
    }

    // Test 7: The Number / Complex / Unknown scenario
    {
        std::cout << "Test 7: Resource scenario... ";
        TaggedUnion<Resources> out;
        Value missingB = Value::object({{"resourceType", "Complex"}, {"resource", Value::object({{"a", 2000}})}});
        auto r = Dispatch(out, missingB, TAG, CONTENT, resources);
        assert(r.error() == DispatchError::CONTENT_INVALID && r.variant_index() == 2);
        assert(r.inner().error() == ParseError::MISSING_FIELD);

        Value complete = Value::object({{"resourceType", "Complex"}, {"resource", Value::object({{"a", 2000}, {"b", 5}})}});
        assert(Dispatch(out, complete, TAG, CONTENT, resources));
        assert(out.index() == 2 && out.get<2>().a == 2000 && out.get<2>().b == 5);

        Value other = Value::object({{"resourceType", "SomethingElse"}, {"resource", Value::object({{"a", 2000}})}});
        assert(Dispatch(out, other, TAG, CONTENT, resources));
        assert(out.is_fallback() && out.get<3>() == other);

        // A tag named like the fallback is still an unknown tag
        Value named = Value::object({{"resourceType", "Unknown"}, {"resource", Value::object({{"c", 4000}})}});
        assert(Dispatch(out, named, TAG, CONTENT, resources) && out.is_fallback());
        std::cout << "PASSED\n";
    }

    // Test 8: Unrelated keys and key order do not matter
    {
        std::cout << "Test 8: Unrelated keys... ";
        TaggedUnion<Resources> out;
        Value raw = Value::object({{"resource", 2000}, {"unrelated", 1234}, {"resourceType", "Number"}});
        assert(DispatchSelects(out, raw, TAG, CONTENT, resources, 0));
        assert(out.get<0>() == 2000);
        std::cout << "PASSED\n";
    }

    // Test 9: Renamed tags and custom decoders
    {
        std::cout << "Test 9: Renamed tags and custom decoders... ";
        using Renamed = std::remove_cvref_t<decltype(renamed)>;
        TaggedUnion<Renamed> r;
        assert(DispatchSelects(r, Value::object({{"resourceType", "string"}, {"resource", "text"}}),
                               TAG, CONTENT, renamed, 0));
        assert(r.get<0>() == "text");
        assert(DispatchSelects(r, Value::object({{"resourceType", "String"}, {"resource", "text"}}),
                               TAG, CONTENT, renamed, 1));

        using Custom = std::remove_cvref_t<decltype(customDecoders)>;
        TaggedUnion<Custom> c;
        assert(DispatchSelects(c, Value::object({{"resourceType", "Number"}, {"resource", 1}}),
                               TAG, CONTENT, customDecoders, 0));
        assert(c.get<0>() == 5);
        assert(DispatchSelects(c, Value::object({{"resourceType", "Number"}}), TAG, CONTENT, customDecoders, 0));

        auto res = Dispatch(c, Value::object({{"resourceType", "Positive"}, {"resource", -3}}), TAG, CONTENT, customDecoders);
        assert(res.error() == DispatchError::CONTENT_INVALID);
        assert(res.inner().error() == ParseError::TRANSFORMER_ERROR);
        assert(res.inner().detail() == "expected a positive number");
        assert(res.inner().errorPath().to_string() == "$.resource");
        assert(c.index() == 0 && c.get<0>() == 5);
        std::cout << "PASSED\n";
    }

    // Test 10: Fallback decoder failures
    {
        std::cout << "Test 10: Fallback failures... ";
        using Labeled_ = std::remove_cvref_t<decltype(labeledFallback)>;
        TaggedUnion<Labeled_> out;
        assert(DispatchSelects(out, Value::object({{"kind", "x"}, {"other", 1}}), TAG, CONTENT, labeledFallback, 1));
        assert(out.get<1>()->kind == "x");

        auto r = Dispatch(out, Value::object({{"other", 1}}), TAG, CONTENT, labeledFallback);
        assert(r.error() == DispatchError::FALLBACK_FAILED);
        assert(r.inner().error() == ParseError::MISSING_FIELD);
        assert(r.inner().errorPath().to_string() == "$.kind");
        assert(out.get<1>()->kind == "x");
        std::cout << "PASSED\n";
    }

    // Test 11: Absent content
    {
        std::cout << "Test 11: Absent content... ";
        using Notes = std::remove_cvref_t<decltype(notes)>;
        TaggedUnion<Notes> out;
        auto r = Dispatch(out, Value::object({{"resourceType", "Note"}}), TAG, CONTENT, notes);
        assert(r.error() == DispatchError::CONTENT_INVALID);
        assert(r.inner().error() == ParseError::MISSING_FIELD);
        assert(r.inner().errorPath().to_string() == "$.resource");

        assert(DispatchSelects(out, Value::object({{"resourceType", "Empty"}}), TAG, CONTENT, notes, 1));
        assert(!out.get<1>().has_value());

        assert(DispatchSelects(out, Value::object({{"resourceType", "Note"}, {"resource", Value::object({{"text", "hi"}})}}),
                               TAG, CONTENT, notes, 0));
        assert(out.get<0>().text == "hi" && !out.get<0>().author);
        std::cout << "PASSED\n";
    }

    // Test 12: Tagged unions nested in models
    {
        std::cout << "Test 12: Nested tagged union... ";
        Shape s;
        Value good = Value::object({
            {"id", "s1"},
            {"body", Value::object({{"kind", "point"}, {"data", Value::object({{"a", 1}, {"b", 2}})}})}
        });
        assert(DecodeSucceeds(s, good));
        assert(s.body.index() == 0 && s.body.get<0>().b == 2);

        Value bad = Value::object({
            {"id", "s1"},
            {"body", Value::object({{"kind", "point"}, {"data", Value::object({{"a", 1}})}})}
        });
        auto r = Decode(s, bad);
        assert(!r);
        assert(r.error() == ParseError::TAGGED_UNION_ERROR);
        assert(r.errorPath().to_string() == "$.body.data.b");
        assert(r.detail().find("CONTENT_INVALID") != std::string_view::npos);

        Value unknown = Value::object({{"id", "s1"}, {"body", Value::object({{"kind", "circle"}})}});
        r = Decode(s, unknown);
        assert(r.error() == ParseError::TAGGED_UNION_ERROR);
        assert(r.errorPath().to_string() == "$.body");
        assert(r.detail().find("UNKNOWN_VARIANT") != std::string_view::npos);
        std::cout << "PASSED (" << ParseResultToString(r) << ")\n";
    }

    // Test 13: Value semantics of the union
    {
        std::cout << "Test 13: Union visit... ";
        TaggedUnion<Resources> out;
        assert(Dispatch(out, Value::object({{"resourceType", "String"}, {"resource", "abc"}}), TAG, CONTENT, resources));
        std::size_t length = out.visit([](const auto & payload) -> std::size_t {
            using P = std::remove_cvref_t<decltype(payload)>;
            if constexpr (std::is_same_v<P, std::string>) {
                return payload.size();
            } else {
                return 0;
            }
        });
        assert(length == 3);
        TaggedUnion<Resources> copy = out;
        assert(copy.index() == 1 && copy.get<1>() == "abc");
        std::cout << "PASSED\n";
    }

    // Test 14: Registry diagnostics
    {
        std::cout << "Test 14: Registry diagnostics... ";
        auto duplicate = BuildRegistry(
            TaggedCase<"Number", std::uint64_t>{},
            TaggedCase<"Number", std::string>{});
        assert(!duplicate);
        assert(RegistryResultToString(duplicate) == "DUPLICATE_TAG: \"Number\"");
        auto twoFallbacks = BuildRegistry(Fallback<Value>{}, Fallback<std::string>{});
        assert(RegistryResultToString(twoFallbacks) == "MULTIPLE_FALLBACKS");
        assert(RegistryResultToString(BuildRegistry(Fallback<Value>{})) == "NO_ERROR");
        std::cout << "PASSED\n";
    }

    // Test 15: Degenerate tables and non-string tag kinds
    {
        std::cout << "Test 15: Degenerate tables... ";
        using NoCases = std::remove_cvref_t<decltype(noCases)>;
        TaggedUnion<NoCases> empty;
        auto r = Dispatch(empty, Value::object({{"resourceType", "x"}}), TAG, CONTENT, noCases);
        assert(r.error() == DispatchError::UNKNOWN_VARIANT);
        assert(r.tag_value() == "x");
        assert(r.known_tags().empty());
        assert(!empty.has_value());
        assert(DispatchFailsWith(empty, Value::array({}), TAG, CONTENT, noCases, DispatchError::NOT_A_MAPPING));

        using FallbackOnly = std::remove_cvref_t<decltype(fallbackOnly)>;
        TaggedUnion<FallbackOnly> any;
        Value tagged = Value::object({{"resourceType", "Number"}, {"resource", 1}});
        assert(DispatchSelects(any, tagged, TAG, CONTENT, fallbackOnly, 0));
        assert(any.is_fallback() && any.get<0>() == tagged);
        assert(DispatchSelects(any, Value("scalar"), TAG, CONTENT, fallbackOnly, 0));
        assert(any.get<0>() == Value("scalar"));

        using NoFallback = std::remove_cvref_t<decltype(resourcesWithoutFallback)>;
        TaggedUnion<NoFallback> strictOut;
        TaggedUnion<Resources> out;
        Value nullTag = Value::object({{"resourceType", nullptr}, {"resource", 1}});
        r = Dispatch(strictOut, nullTag, TAG, CONTENT, resourcesWithoutFallback);
        assert(r.error() == DispatchError::TAG_NOT_A_STRING && r.found_kind() == ValueKind::Null);
        assert(DispatchSelects(out, nullTag, TAG, CONTENT, resources, 3));

        Value boolTag = Value::object({{"resourceType", true}, {"resource", 1}});
        r = Dispatch(strictOut, boolTag, TAG, CONTENT, resourcesWithoutFallback);
        assert(r.error() == DispatchError::TAG_NOT_A_STRING && r.found_kind() == ValueKind::Bool);
        assert(DispatchSelects(out, boolTag, TAG, CONTENT, resources, 3));

        // A content field name holding a dot stays one path step
        Value dotted = Value::object({{"resourceType", "Complex"}, {"a.b", Value::object({{"a", 1}})}});
        r = Dispatch(out, dotted, TAG, "a.b", resources);
        assert(r.error() == DispatchError::CONTENT_INVALID);
        assert(r.inner().errorPath().to_string() == "$[\"a.b\"].b");
        std::cout << "PASSED\n";
    }

    std::cout << "\nAll dispatch tests passed!\n";
    return 0;
}

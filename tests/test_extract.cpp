/**
 * @file test_extract.cpp
 * @brief Unit tests for message and position extraction helpers
 */

#include "test_framework.h"
#include "core/message_extract.hpp"

#include <string>
#include <vector>

using namespace tsanalyzer;

// ============================================================================
// Quote splitting
// ============================================================================

TEST(Extract, SplitQuoted) {
    auto parts = split_quoted("Cannot find module 'fs-extra' or its types.");
    cf_assert(parts.size() == 3);
    test_assert_str_eq(parts[0], "Cannot find module ");
    test_assert_str_eq(parts[1], "fs-extra");
    test_assert_str_eq(parts[2], " or its types.");

    auto trailing = split_quoted("a 'b'");
    cf_assert(trailing.size() == 3);
    test_assert_str_eq(trailing[2], "");

    cf_assert(split_quoted("").size() == 1);
    return 0;
}

TEST(Extract, QuotedPartPlaceholder) {
    const std::string msg = "Property 'bar' does not exist on type 'Foo'.";
    test_assert_str_eq(quoted_part(msg, 1, "property"), "bar");
    test_assert_str_eq(quoted_part(msg, 3, "type"), "Foo");
    test_assert_str_eq(quoted_part(msg, 5, "other"), "other");
    test_assert_str_eq(quoted_part("no quotes here", 1, "function"), "function");
    // An empty quoted value is not a missing part
    test_assert_str_eq(quoted_part("x '' y", 1, "placeholder"), "");
    return 0;
}

// ============================================================================
// Token lookup
// ============================================================================

TEST(Extract, FindTokenAtColumn) {
    std::vector<token> tokens = {
        {"add", 5, 0}, {"(", 5, 3}, {"1", 5, 4}, {")", 5, 5}, {"foo", 6, 2},
    };

    const token *tok = find_token_at(tokens, 5, 1);
    cf_assert(tok != nullptr);
    test_assert_str_eq(tok->raw, "add");

    tok = find_token_at(tokens, 5, 3);
    cf_assert(tok != nullptr);
    test_assert_str_eq(tok->raw, "add");

    tok = find_token_at(tokens, 5, 4);
    cf_assert(tok != nullptr);
    test_assert_str_eq(tok->raw, "(");

    tok = find_token_at(tokens, 6, 3);
    cf_assert(tok != nullptr);
    test_assert_str_eq(tok->raw, "foo");
    return 0;
}

TEST(Extract, FindTokenMisses) {
    std::vector<token> tokens = {{"foo", 5, 2}};
    cf_assert(find_token_at(tokens, 5, 2) == nullptr);  // column 1 (0-based)
    cf_assert(find_token_at(tokens, 5, 6) == nullptr);  // one past the end
    cf_assert(find_token_at(tokens, 4, 3) == nullptr);  // other line
    cf_assert(find_token_at(tokens, 5, 0) == nullptr);  // no 0 column
    cf_assert(find_token_at({}, 1, 1) == nullptr);
    return 0;
}

TEST(Extract, FindTokenCountsCharacters) {
    // "héllo" is 5 characters but 6 bytes
    std::vector<token> tokens = {{"h\xc3\xa9llo", 1, 0}, {"x", 1, 6}};
    const token *tok = find_token_at(tokens, 1, 5);
    cf_assert(tok != nullptr);
    test_assert_str_eq(tok->raw, "h\xc3\xa9llo");
    cf_assert(find_token_at(tokens, 1, 6) == nullptr);
    return 0;
}

TEST(Extract, FindTokenFirstMatchWins) {
    std::vector<token> tokens = {{"first", 2, 0}, {"second", 2, 0}};
    const token *tok = find_token_at(tokens, 2, 1);
    cf_assert(tok != nullptr);
    test_assert_str_eq(tok->raw, "first");
    return 0;
}

// ============================================================================
// Assignment and missing-property messages
// ============================================================================

TEST(Extract, AssignmentTypes) {
    auto types = parse_assignment_types(
        "Type 'string' is not assignable to type 'number'.");
    cf_assert(types.has_value());
    test_assert_str_eq(types->first, "string");
    test_assert_str_eq(types->second, "number");

    auto nested = parse_assignment_types(
        "Type '{ a: string; }' is not assignable to type 'Props'.");
    cf_assert(nested.has_value());
    test_assert_str_eq(nested->first, "{ a: string; }");
    test_assert_str_eq(nested->second, "Props");
    return 0;
}

TEST(Extract, AssignmentTypesMissing) {
    cf_assert(!parse_assignment_types("Something else entirely.").has_value());
    cf_assert(!parse_assignment_types("Type 'string' is wrong.").has_value());
    cf_assert(!parse_assignment_types("Type 'unterminated").has_value());
    // The marker needs a preceding character
    cf_assert(!parse_assignment_types("ype 'a' 'b'").has_value());
    return 0;
}

TEST(Extract, MissingPropertyType) {
    auto type_name = parse_missing_property_type(
        "Property 'age' is missing in type '{ name: string; }' but required in type 'User'.");
    cf_assert(type_name.has_value());
    test_assert_str_eq(*type_name, "User");

    cf_assert(!parse_missing_property_type("Property 'age' is missing.").has_value());
    cf_assert(!parse_missing_property_type("required in type 'User").has_value());
    return 0;
}

// ============================================================================
// Object literal types
// ============================================================================

TEST(Extract, ObjectProperties) {
    auto props = parse_object_properties("{ a: string; b: number; }");
    cf_assert(props.size() == 2);
    test_assert_str_eq(props["a"], "string");
    test_assert_str_eq(props["b"], "number");

    // Only the first ':' splits a clause
    auto fn = parse_object_properties("{ cb: (x: number) => void }");
    cf_assert(fn.size() == 1);
    test_assert_str_eq(fn["cb"], "(x: number) => void");
    return 0;
}

TEST(Extract, ObjectPropertiesMalformed) {
    cf_assert(parse_object_properties("string").empty());
    cf_assert(parse_object_properties("{ a: string").empty());
    cf_assert(parse_object_properties("").empty());
    cf_assert(parse_object_properties("{}").empty());
    cf_assert(parse_object_properties("{ novalue; }").empty());
    return 0;
}

TEST(Extract, DiffReportsTypeChanges) {
    auto diff = diff_argument_object_types(
        "Argument of type '{ a: string; b: string; }' is not assignable to "
        "parameter of type '{ a: string; b: number; }'.");
    cf_assert(diff.has_value());
    cf_assert(diff->size() == 1);
    test_assert_str_eq((*diff)[0].property, "b");
    test_assert_str_eq((*diff)[0].provided, "string");
    test_assert_str_eq((*diff)[0].expected, "number");
    return 0;
}

TEST(Extract, DiffOrderIndependent) {
    auto diff = diff_argument_object_types(
        "Argument of type '{ b: string; a: string; }' is not assignable to "
        "parameter of type '{ b: number; a: string; }'.");
    cf_assert(diff.has_value());
    cf_assert(diff->size() == 1);
    test_assert_str_eq((*diff)[0].property, "b");
    test_assert_str_eq((*diff)[0].provided, "string");
    test_assert_str_eq((*diff)[0].expected, "number");
    return 0;
}

TEST(Extract, DiffSortedByProperty) {
    auto diff = diff_argument_object_types(
        "Argument of type '{ z: string; m: string; a: string; only: boolean; }' "
        "is not assignable to parameter of type "
        "'{ z: number; m: boolean; a: Date; extra: string; }'.");
    cf_assert(diff.has_value());
    cf_assert(diff->size() == 3);
    test_assert_str_eq((*diff)[0].property, "a");
    test_assert_str_eq((*diff)[1].property, "m");
    test_assert_str_eq((*diff)[2].property, "z");
    return 0;
}

TEST(Extract, DiffWithoutMarkers) {
    cf_assert(!diff_argument_object_types("Type 'a' is not 'b'.").has_value());

    // Non-object literals parse to empty maps, so nothing differs
    auto scalar = diff_argument_object_types(
        "Argument of type 'number' is not assignable to parameter of type 'string'.");
    cf_assert(scalar.has_value());
    cf_assert(scalar->empty());
    return 0;
}

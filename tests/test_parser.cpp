/**
 * @file test_parser.cpp
 * @brief Unit tests for diagnostic line parsing
 */

#include "test_framework.h"
#include "core/diagnostic_parser.hpp"

#include <string>

using namespace tsanalyzer;

TEST(Parser, ParseValid) {
    auto err = parse_diagnostic(
        "src/app.ts(10,5): error TS2322: Type 'string' is not assignable to type 'number'.");
    cf_assert(err.has_value());
    test_assert_str_eq(err->file, "src/app.ts");
    cf_assert(err->line == 10);
    cf_assert(err->column == 5);
    cf_assert(err->code.kind == error_kind::TYPE_MISMATCH);
    test_assert_str_eq(err->message,
                       "Type 'string' is not assignable to type 'number'.");
    return 0;
}

TEST(Parser, ParseUnsupportedCode) {
    auto err = parse_diagnostic("lib/a.ts(1,1): error TS1005: ';' expected.");
    cf_assert(err.has_value());
    cf_assert(err->code.kind == error_kind::UNSUPPORTED);
    test_assert_str_eq(err->code.to_string(), "TS1005");
    test_assert_str_eq(err->message, "';' expected.");
    return 0;
}

TEST(Parser, MessageKeepsLaterSeparators) {
    // Only the first ": " splits the code from the message
    auto err = parse_diagnostic(
        "a.ts(2,3): error TS2345: Argument of type '{ a: string; }' is not assignable.");
    cf_assert(err.has_value());
    test_assert_str_eq(err->message,
                       "Argument of type '{ a: string; }' is not assignable.");
    return 0;
}

TEST(Parser, RejectsMissingSeparators) {
    cf_assert(!parse_diagnostic("bad input").has_value());
    cf_assert(!parse_diagnostic("").has_value());
    cf_assert(!parse_diagnostic("a.ts10,5): error TS2322: msg").has_value());
    cf_assert(!parse_diagnostic("a.ts(10,5) error TS2322: msg").has_value());
    cf_assert(!parse_diagnostic("a.ts(10 5): error TS2322: msg").has_value());
    cf_assert(!parse_diagnostic("a.ts(10,5): error TS2322 msg").has_value());
    cf_assert(!parse_diagnostic("a.ts(10,5): warning TS2322: msg").has_value());
    return 0;
}

TEST(Parser, RejectsNonNumericCoordinates) {
    cf_assert(!parse_diagnostic("a.ts(3,x): error TS2322: msg").has_value());
    cf_assert(!parse_diagnostic("a.ts(y,3): error TS2322: msg").has_value());
    cf_assert(!parse_diagnostic("a.ts(,3): error TS2322: msg").has_value());
    cf_assert(!parse_diagnostic("a.ts(3,): error TS2322: msg").has_value());
    cf_assert(!parse_diagnostic("a.ts(-3,1): error TS2322: msg").has_value());
    cf_assert(!parse_diagnostic("a.ts( 3,1): error TS2322: msg").has_value());
    cf_assert(!parse_diagnostic("a.ts(3,1,2): error TS2322: msg").has_value());
    return 0;
}

TEST(Parser, RejectsOverflowingCoordinates) {
    cf_assert(!parse_diagnostic("a.ts(99999999999,1): error TS2322: msg").has_value());
    cf_assert(!parse_diagnostic(
                   "a.ts(1,999999999999999999999999): error TS2322: msg")
                   .has_value());
    return 0;
}

TEST(Parser, ZeroCoordinatesAccepted) {
    auto err = parse_diagnostic("a.ts(0,0): error TS2322: msg");
    cf_assert(err.has_value());
    cf_assert(err->line == 0);
    cf_assert(err->column == 0);
    return 0;
}

TEST(Parser, ParenthesisInPathSplitsEarly) {
    // Known limitation: the first '(' ends the file path
    auto err = parse_diagnostic("src/(group)/a.ts(1,2): error TS2322: msg");
    cf_assert(!err.has_value());
    return 0;
}

TEST(Parser, ExtendedCodes) {
    const std::string line = "a.ts(4,9): error TS2304: Cannot find name 'foo'.";
    auto plain = parse_diagnostic(line);
    auto extended = parse_diagnostic(line, true);
    cf_assert(plain.has_value() && extended.has_value());
    cf_assert(plain->code.kind == error_kind::UNSUPPORTED);
    cf_assert(extended->code.kind == error_kind::CANNOT_FIND_IDENTIFIER);
    return 0;
}

TEST(Parser, Idempotent) {
    const std::string line =
        "src/app.ts(10,5): error TS2339: Property 'bar' does not exist on type '{ foo: number; }'.";
    auto first = parse_diagnostic(line);
    auto second = parse_diagnostic(line);
    cf_assert(first.has_value() && second.has_value());
    test_assert_str_eq(first->file, second->file);
    cf_assert(first->line == second->line);
    cf_assert(first->column == second->column);
    cf_assert(first->code == second->code);
    test_assert_str_eq(first->message, second->message);
    return 0;
}

TEST(Parser, BatchOutput) {
    const std::string output =
        "src/a.ts(1,5): error TS2322: Type 'string' is not assignable to type 'number'.\r\n"
        "  The expected type comes from property 'x'.\n"
        "src/b.ts(7,1): error TS2554: Expected 2 arguments, but got 1.\n"
        "\n"
        "Found 2 errors in 2 files.\n";

    auto errors = parse_diagnostic_output(output);
    cf_assert(errors.size() == 2);
    test_assert_str_eq(errors[0].file, "src/a.ts");
    test_assert_str_eq(errors[0].message,
                       "Type 'string' is not assignable to type 'number'.");
    test_assert_str_eq(errors[1].file, "src/b.ts");
    cf_assert(errors[1].line == 7);
    cf_assert(errors[1].code.kind == error_kind::MISSING_PARAMETERS);
    return 0;
}

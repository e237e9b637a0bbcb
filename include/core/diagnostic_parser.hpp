/**
 * @file diagnostic_parser.hpp
 * @brief Parsing and classification of TypeScript compiler diagnostics
 *
 * Diagnostics are single lines in the non-pretty tsc format:
 *
 *   src/app.ts(10,5): error TS2322: Type 'string' is not assignable to ...
 */

#pragma once

#include "core/types.h"

#include <optional>
#include <string>
#include <vector>

namespace tsanalyzer {

/**
 * @brief Closed set of diagnostic categories
 *
 * The categories after INCORRECT_INTERFACE_IMPLEMENTATION are only produced
 * by the extended code table.
 */
enum class error_kind {
  TYPE_MISMATCH,
  INLINE_TYPE_MISMATCH,
  MISSING_PARAMETERS,
  NO_IMPLICIT_ANY,
  PROPERTY_MISSING_IN_TYPE,
  UNINTENTIONAL_COMPARISON,
  PROPERTY_DOES_NOT_EXIST,
  OBJECT_POSSIBLY_UNDEFINED,
  OBJECT_POSSIBLY_NULL,
  OBJECT_IS_UNKNOWN,
  DIRECT_CAST_POTENTIALLY_MISTAKEN,
  SPREAD_ARGUMENT_MUST_BE_TUPLE,
  RIGHT_SIDE_ARITHMETIC_MUST_BE_NUMBER,
  INCOMPATIBLE_OVERLOAD,
  INVALID_SHADOW_IN_SCOPE,
  NON_EXISTENT_MODULE_IMPORT,
  READONLY_PROPERTY_ASSIGNMENT,
  INCORRECT_INTERFACE_IMPLEMENTATION,
  LEFT_SIDE_ARITHMETIC_MUST_BE_NUMBER,
  PROPERTY_NOT_ASSIGNABLE_TO_BASE,
  CANNOT_FIND_IDENTIFIER,
  MISSING_RETURN_VALUE,
  UNCALLABLE_EXPRESSION,
  INVALID_INDEX_TYPE,
  TYPO_PROPERTY_ON_TYPE,
  UNSUPPORTED
};

/**
 * @brief A classified diagnostic code
 *
 * Unsupported codes keep the original code string so it can be shown
 * without loss.
 */
struct error_code {
  error_kind kind = error_kind::UNSUPPORTED;
  std::string unsupported_code; // Only set when kind == UNSUPPORTED

  static error_code of(error_kind kind);
  static error_code unsupported(const std::string &code);

  bool is_supported() const { return kind != error_kind::UNSUPPORTED; }

  /**
   * @brief Canonical code string for this category
   *
   * Aliased categories return their first code (TS2532 for both TS2532
   * and TS18048). Unsupported codes return the stored original.
   */
  std::string to_string() const;

  bool operator==(const error_code &other) const;
  bool operator!=(const error_code &other) const { return !(*this == other); }
};

/**
 * @brief Structured form of one diagnostic line
 *
 * line and column are 1-based positions in file, taken verbatim from the
 * diagnostic text.
 */
struct ts_error {
  std::string file;
  tsanalyzer_uint_t line = 0;
  tsanalyzer_uint_t column = 0;
  error_code code;
  std::string message;
};

/**
 * @brief Kebab-case category name (e.g. "type-mismatch")
 */
const char *error_kind_name(error_kind kind);

/**
 * @brief Map a raw code string to its category
 *
 * Never fails: unknown codes classify as unsupported with the original
 * string preserved.
 *
 * @param code Raw code string, e.g. "TS2322"
 * @param extended Also recognize the codes of the synthesis-only categories
 * @return The classified code
 */
error_code classify_error_code(const std::string &code, bool extended = false);

/**
 * @brief Parse one diagnostic line
 *
 * Grammar: <file>(<line>,<column>): error <code>: <message>
 * Only the first occurrence of each separator is used. File paths that
 * contain '(' are split at the wrong place; this is a known limitation.
 *
 * @param line The raw diagnostic line
 * @param extended_codes Classify with the extended code table
 * @return The parsed error, or nullopt when the line does not match
 */
std::optional<ts_error> parse_diagnostic(const std::string &line,
                                         bool extended_codes = false);

/**
 * @brief Parse every diagnostic line of a compiler output block
 *
 * Lines that do not match the grammar (continuation lines, summaries) are
 * skipped. A trailing '\r' is removed from each line before parsing.
 *
 * @param output Raw multi-line compiler output
 * @param extended_codes Classify with the extended code table
 * @return Parsed errors in input order
 */
std::vector<ts_error> parse_diagnostic_output(const std::string &output,
                                              bool extended_codes = false);

} // namespace tsanalyzer

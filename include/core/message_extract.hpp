/**
 * @file message_extract.hpp
 * @brief Helpers that pull names and types out of diagnostic messages
 *
 * Extraction is tied to the wording of the compiler's message templates.
 * When the wording does not match, helpers return nullopt or an empty
 * result; callers substitute generic placeholders.
 */

#pragma once

#include "core/diagnostic_parser.hpp"
#include "core/tokenizer.hpp"
#include "core/types.h"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tsanalyzer {

/**
 * @brief A property whose provided type differs from the expected one
 */
struct property_mismatch {
  std::string property;
  std::string provided;
  std::string expected;
};

/**
 * @brief Split a message on every '\'' character
 *
 * Empty parts are kept, so "a 'b'" yields {"a ", "b", ""}.
 */
std::vector<std::string> split_quoted(const std::string &message);

/**
 * @brief Positional part of a quote-split message
 *
 * Odd indices are quoted values: 1 is the first quoted value, 3 the
 * second, and so on.
 *
 * @param message The diagnostic message
 * @param index Part index after splitting on '\''
 * @param placeholder Returned when the part does not exist
 */
std::string quoted_part(const std::string &message, tsanalyzer_size_t index,
                        const std::string &placeholder);

/**
 * @brief Find the token whose span covers a diagnostic position
 *
 * The 1-based column is converted to 0-based and matched against
 * [token.column, token.column + length) on the same line. The first match
 * in sequence order wins.
 *
 * @return The token, or nullptr when none covers the position
 */
const token *find_token_at(const std::vector<token> &tokens,
                           tsanalyzer_uint_t line, tsanalyzer_uint_t column);

/**
 * @brief Source and target types of an assignability message
 *
 * Finds the first "ype '" marker and returns the quoted type after it
 * together with the next quoted value.
 */
std::optional<std::pair<std::string, std::string>>
parse_assignment_types(const std::string &message);

/**
 * @brief The last quoted type in a "missing in type" message
 */
std::optional<std::string> parse_missing_property_type(const std::string &message);

/**
 * @brief Text after marker up to the next '\''
 */
std::optional<std::string> extract_object_type(const std::string &message,
                                               const std::string &marker);

/**
 * @brief Parse "{ a: string; b: number }" into a property -> type map
 *
 * Clauses are split on ';' and each clause on its first ':'. Anything that
 * is not wrapped in braces yields an empty map.
 */
std::map<std::string, std::string>
parse_object_properties(const std::string &object_type);

/**
 * @brief Compare the argument and parameter object types of a TS2345 message
 *
 * Reports every expected property that is provided with a different type,
 * ordered by property name. Properties present on one side only are not
 * reported.
 *
 * @return The mismatches, or nullopt when either marker is missing
 */
std::optional<std::vector<property_mismatch>>
diff_argument_object_types(const std::string &message);

} // namespace tsanalyzer

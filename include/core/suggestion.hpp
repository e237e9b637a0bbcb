/**
 * @file suggestion.hpp
 * @brief Context-aware fix suggestions for classified diagnostics
 */

#pragma once

#include "core/diagnostic_parser.hpp"
#include "core/tokenizer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tsanalyzer {

/**
 * @brief Suggestion lines plus an optional help line for one diagnostic
 */
struct suggestion {
  std::vector<std::string> suggestions;
  std::optional<std::string> help;
};

/**
 * @brief Options for suggestion synthesis
 */
struct synthesis_options {
  // Wrap extracted names in terminal colors and bold
  bool colorize = false;
};

/**
 * @brief Build a suggestion for a classified diagnostic
 *
 * Each category has one handler. Handlers extract names and types from the
 * message text and, where the message under-identifies the subject, from
 * the token at the error position. Missing context degrades to generic
 * placeholders rather than failure.
 *
 * object-is-unknown, object-possibly-null and unsupported codes have no
 * handler and always yield nullopt.
 *
 * @param err The parsed diagnostic
 * @param tokens Tokens of err.file
 * @param options Output styling
 * @return The suggestion, or nullopt when the category is not covered
 */
std::optional<suggestion> synthesize_suggestion(const ts_error &err,
                                                const std::vector<token> &tokens,
                                                const synthesis_options &options = {});

/**
 * @brief Whether synthesize_suggestion covers a category
 */
bool has_suggestion_handler(error_kind kind);

} // namespace tsanalyzer

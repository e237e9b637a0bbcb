/**
 * @file suggestion_format.hpp
 * @brief Rendering of analyzed diagnostics in a Cargo-like style
 */

#pragma once

#include "core/diagnostic_parser.hpp"
#include "core/suggestion.hpp"
#include "core/tokenizer.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tsanalyzer {

/**
 * @brief Options for rendering an analyzed diagnostic
 */
struct render_options {
  bool color = true;       // ANSI colors for headers, gutters and carets
  bool show_source = true; // Source snippet with caret under the column
};

/**
 * @brief Statistics for one analysis run
 */
struct analysis_summary {
  int total = 0;
  int with_suggestion = 0;
  int without_suggestion = 0;
  std::map<std::string, int> categories; // category name -> count
};

/**
 * @brief Format one diagnostic with its suggestion
 *
 * Example output:
 *   error[TS2322]: Type 'string' is not assignable to type 'number'.
 *     --> src/app.ts:10:5
 *      |
 *   10 | let x: number = "five";
 *      |     ^
 *      = suggestion: Try converting this value from `string` to `number`.
 *      = help: Ensure that the types are compatible ...
 *
 * @param err The parsed diagnostic
 * @param result The synthesized suggestion, if any
 * @param source_line Source text of err.line, empty to omit the snippet
 * @param tokens Tokens of err.file, used to size the caret run
 * @param options Rendering options
 */
std::string format_analysis_to_string(const ts_error &err,
                                      const std::optional<suggestion> &result,
                                      const std::string &source_line,
                                      const std::vector<token> &tokens,
                                      const render_options &options);

/**
 * @brief Read one 1-based line from a file
 *
 * @return The line without its terminator, or an empty string
 */
std::string read_source_line(const std::string &file_path,
                             tsanalyzer_uint_t line_number);

/**
 * @brief Record one analyzed diagnostic into the summary
 */
void record_analysis(analysis_summary &summary, const ts_error &err,
                     bool has_suggestion);

/**
 * @brief Format the run summary
 *
 * Example output:
 *   4 diagnostics analyzed, 3 with suggestions, 1 without
 *      2 type-mismatch
 *      1 missing-parameters
 *      1 object-is-unknown
 *
 * @return The summary, or an empty string when nothing was analyzed
 */
std::string format_analysis_summary(const analysis_summary &summary);

} // namespace tsanalyzer

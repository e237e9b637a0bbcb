/**
 * @file command_explain.cpp
 * @brief Implementation of the 'explain' command
 */

#include "core/commands.hpp"
#include "core/diagnostic_parser.hpp"
#include "core/suggestion.hpp"
#include "tsanalyzer/log.hpp"

#include <string>

using namespace tsanalyzer;

/**
 * @brief Print the category, canonical code and coverage of a code string
 *
 * @param ctx Context containing parsed arguments
 * @return tsanalyzer_int_t Exit code (0 for success)
 */
tsanalyzer_int_t tsanalyzer_cmd_explain(const tsanalyzer_context_t *ctx) {
  if (ctx->args.arg_count < 1) {
    logger::print_error("No diagnostic code given");
    logger::print_plain("Usage: tsanalyzer explain <code> [--extended]");
    return 1;
  }

  std::string raw = ctx->args.args[0];
  error_code code = classify_error_code(raw, ctx->args.extended);

  logger::print_action("Code", raw);
  logger::print_action("Category", error_kind_name(code.kind));
  if (code.is_supported()) {
    logger::print_action("Canonical", code.to_string());
  }
  logger::print_action("Suggestion", has_suggestion_handler(code.kind)
                                         ? "available"
                                         : "not available");
  return 0;
}

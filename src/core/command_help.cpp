/**
 * @file command_help.cpp
 * @brief Implementation of the 'help' command to provide usage information
 */

#include "core/commands.hpp"
#include "core/constants.h"
#include "tsanalyzer/log.hpp"

#include <string>

using namespace tsanalyzer;

/**
 * @brief Handle the 'help' command
 *
 * @param ctx Context containing parsed arguments
 * @return tsanalyzer_int_t Exit code (0 for success)
 */
tsanalyzer_int_t tsanalyzer_cmd_help(const tsanalyzer_context_t *ctx) {
  std::string specific_command;

  // Check if a specific command was requested
  if (ctx->args.command && ctx->args.arg_count > 0) {
    specific_command = ctx->args.args[0];
  }

  if (specific_command.empty()) {
    logger::print_lines({
        "tsanalyzer - fix suggestions for TypeScript compiler diagnostics",
        "",
        "Available commands:",
        "  analyze   Suggest fixes for tsc output read from a file or stdin",
        "  explain   Show the category of a diagnostic code",
        "  version   Show version information",
        "  help      Show help for a specific command",
        "",
        "Usage: tsanalyzer <command> [options]",
        "",
        "For more information on a specific command, run "
        "'tsanalyzer help <command>'",
    });
  } else if (specific_command == "analyze") {
    logger::print_plain("tsanalyzer analyze - Suggest fixes for compiler diagnostics");
    logger::print_plain("");
    logger::print_plain("Usage: tsanalyzer analyze [<file>|-] [options]");
    logger::print_plain("");
    logger::print_plain("Reads 'tsc --pretty false' output and prints a suggestion");
    logger::print_plain("for every diagnostic line. Without a file, reads stdin.");
    logger::print_plain("");
    logger::print_plain("Options:");
    logger::print_plain("  -c, --config <path>   Configuration file (default: " TSANALYZER_CONFIG_FILE ")");
    logger::print_plain("  --no-color            Disable colored output");
    logger::print_plain("  --extended            Recognize the extended diagnostic code table");
    logger::print_plain("  --verbosity <level>   quiet, normal or verbose");
    logger::print_plain("  -q, --quiet           Only print the analysis");
    logger::print_plain("  -v, --verbose         Trace tokenized files and skipped lines");
    logger::print_plain("");
    logger::print_plain("Example:");
    logger::print_plain("  npx tsc --noEmit --pretty false | tsanalyzer analyze");
  } else if (specific_command == "explain") {
    logger::print_plain("tsanalyzer explain - Show the category of a diagnostic code");
    logger::print_plain("");
    logger::print_plain("Usage: tsanalyzer explain <code> [--extended]");
    logger::print_plain("");
    logger::print_plain("Example:");
    logger::print_plain("  tsanalyzer explain TS18048");
  } else if (specific_command == "version") {
    logger::print_plain("tsanalyzer version - Show version information");
    logger::print_plain("");
    logger::print_plain("Usage: tsanalyzer version");
  } else if (specific_command == "help") {
    logger::print_plain("tsanalyzer help - Show help information");
    logger::print_plain("");
    logger::print_plain("Usage: tsanalyzer help [command]");
  } else {
    logger::print_error("Unknown command: " + specific_command);
    logger::print_plain("Run 'tsanalyzer help' for a list of available commands");
    return 1;
  }

  return 0;
}

/**
 * @file command_dispatch.cpp
 * @brief Routing of the primary command to its handler
 */

#include "core/command.h"
#include "core/commands.hpp"
#include "tsanalyzer/log.hpp"

#include <cstring>
#include <string>

using namespace tsanalyzer;

/**
 * @brief Dispatch command based on command line arguments
 *
 * @param ctx Context containing parsed arguments
 * @return tsanalyzer_int_t Exit code (0 for success)
 */
extern "C" tsanalyzer_int_t tsanalyzer_dispatch_command(const tsanalyzer_context_t *ctx) {
  // No command specified, show help
  if (!ctx->args.command) {
    return tsanalyzer_cmd_help(ctx);
  }

  if (strcmp(ctx->args.command, "analyze") == 0) {
    return tsanalyzer_cmd_analyze(ctx);
  } else if (strcmp(ctx->args.command, "explain") == 0) {
    return tsanalyzer_cmd_explain(ctx);
  } else if (strcmp(ctx->args.command, "version") == 0 ||
             strcmp(ctx->args.command, "--version") == 0) {
    return tsanalyzer_cmd_version(ctx);
  } else if (strcmp(ctx->args.command, "help") == 0 ||
             strcmp(ctx->args.command, "--help") == 0 ||
             strcmp(ctx->args.command, "-h") == 0) {
    return tsanalyzer_cmd_help(ctx);
  }

  logger::print_error("Unknown command: " + std::string(ctx->args.command));
  logger::print_plain("Run 'tsanalyzer help' for a list of commands");
  return 1;
}

/**
 * @file main.cpp
 * @brief Main entry point for tsanalyzer
 */

#include "core/command.h"
#include "core/commands.hpp"

/**
 * @brief Main function
 *
 * @param argc Argument count
 * @param argv Argument values
 * @return int Exit code
 */
int main(int argc, char *argv[]) {
  tsanalyzer_context_t ctx;
  if (!tsanalyzer_parse_args(argc, argv, &ctx)) {
    tsanalyzer_free_args(&ctx.args);
    return 1;
  }

  tsanalyzer_set_verbosity(ctx.args.verbosity);

  tsanalyzer_int_t result = tsanalyzer_dispatch_command(&ctx);
  tsanalyzer_free_args(&ctx.args);
  return result;
}

/**
 * @file command.cpp
 * @brief Implementation of command line argument handling
 */

#include <cstdlib>
#include <cstring>
#include <string>

#include "core/command.h"
#include "tsanalyzer/log.hpp"

using namespace tsanalyzer;

bool tsanalyzer_parse_args(tsanalyzer_int_t argc, tsanalyzer_string_t argv[],
                           tsanalyzer_context_t *ctx) {
  memset(ctx, 0, sizeof(tsanalyzer_context_t));

  // Need at least one argument (the command)
  if (argc < 2) {
    return true;
  }

  tsanalyzer_command_args_t *args = &ctx->args;
  args->command = argv[1];

  // Room for every remaining argument plus a terminating NULL
  args->args = (tsanalyzer_string_t *)malloc(argc * sizeof(tsanalyzer_string_t));
  if (!args->args) {
    logger::print_error("Out of memory while parsing arguments");
    return false;
  }
  args->arg_count = 0;

  for (tsanalyzer_int_t i = 2; i < argc; i++) {
    tsanalyzer_string_t arg = argv[i];

    if (strcmp(arg, "-c") == 0 || strcmp(arg, "--config") == 0) {
      if (i + 1 >= argc) {
        logger::print_error(std::string("Missing value for ") + arg);
        return false;
      }
      args->config = argv[++i];
    } else if (strncmp(arg, "--config=", 9) == 0) {
      args->config = arg + 9;
    } else if (strcmp(arg, "--verbosity") == 0) {
      if (i + 1 >= argc) {
        logger::print_error("Missing value for --verbosity");
        return false;
      }
      args->verbosity = argv[++i];
    } else if (strncmp(arg, "--verbosity=", 12) == 0) {
      args->verbosity = arg + 12;
    } else if (strcmp(arg, "-v") == 0 || strcmp(arg, "--verbose") == 0) {
      args->verbosity = "verbose";
    } else if (strcmp(arg, "-q") == 0 || strcmp(arg, "--quiet") == 0) {
      args->verbosity = "quiet";
    } else if (strcmp(arg, "--no-color") == 0) {
      args->no_color = true;
    } else if (strcmp(arg, "--extended") == 0) {
      args->extended = true;
    } else {
      // Positional argument; a lone "-" means stdin
      args->args[args->arg_count++] = arg;
    }
  }

  args->args[args->arg_count] = NULL;
  return true;
}

void tsanalyzer_free_args(tsanalyzer_command_args_t *args) {
  if (args->args) {
    free(args->args);
    args->args = NULL;
  }
  args->arg_count = 0;
}

void tsanalyzer_set_verbosity(tsanalyzer_cstring_t level) {
  if (!level)
    return;

  if (strcmp(level, "quiet") == 0) {
    tsanalyzer_set_verbosity_impl(TSANALYZER_VERBOSITY_QUIET);
  } else if (strcmp(level, "verbose") == 0) {
    tsanalyzer_set_verbosity_impl(TSANALYZER_VERBOSITY_VERBOSE);
  } else {
    tsanalyzer_set_verbosity_impl(TSANALYZER_VERBOSITY_NORMAL);
  }
}

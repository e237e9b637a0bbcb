/**
 * @file command.h
 * @brief Command line argument parsing and command dispatching for tsanalyzer
 */

#ifndef TSANALYZER_COMMAND_H
#define TSANALYZER_COMMAND_H

#include <stdbool.h>

#include "core/constants.h"
#include "core/types.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Command line argument structure
 * @details Strings point into argv; only the args array is allocated.
 */
typedef struct {
  tsanalyzer_string_t command;    // Primary command (analyze, explain, ...)
  tsanalyzer_string_t config;     // Optional configuration file path
  tsanalyzer_cstring_t verbosity; // Verbosity level (quiet, normal, verbose)
  tsanalyzer_string_t *args;      // Positional arguments after the command
  tsanalyzer_int_t arg_count;     // Number of positional arguments
  bool no_color;                  // --no-color
  bool extended;                  // --extended
} tsanalyzer_command_args_t;

/**
 * @brief Context structure for command execution
 */
typedef struct {
  tsanalyzer_command_args_t args;
} tsanalyzer_context_t;

/**
 * @brief Parse command line arguments into a context
 * @return false when an option is missing its value
 */
bool tsanalyzer_parse_args(tsanalyzer_int_t argc, tsanalyzer_string_t argv[],
                           tsanalyzer_context_t *ctx);

/**
 * @brief Free allocated resources in command arguments
 */
void tsanalyzer_free_args(tsanalyzer_command_args_t *args);

/**
 * @brief Set the verbosity level for logging (quiet, normal, verbose)
 */
void tsanalyzer_set_verbosity(tsanalyzer_cstring_t level);

#ifdef __cplusplus
}
#endif

#endif // TSANALYZER_COMMAND_H

/**
 * @file commands.hpp
 * @brief Declarations for tsanalyzer command handlers
 */

#pragma once

#include "core/command.h"
#include "core/types.h"

/**
 * @brief Dispatch a command based on command line arguments
 *
 * @param ctx Context containing parsed arguments
 * @return tsanalyzer_int_t Exit code (0 for success)
 */
extern "C" tsanalyzer_int_t tsanalyzer_dispatch_command(const tsanalyzer_context_t *ctx);

/**
 * @brief Handle the 'analyze' command
 *
 * Reads compiler output from a file or stdin and prints a suggestion for
 * every diagnostic line.
 *
 * @param ctx Context containing parsed arguments
 * @return tsanalyzer_int_t Exit code (0 for success)
 */
tsanalyzer_int_t tsanalyzer_cmd_analyze(const tsanalyzer_context_t *ctx);

/**
 * @brief Handle the 'explain' command to describe a diagnostic code
 *
 * @param ctx Context containing parsed arguments
 * @return tsanalyzer_int_t Exit code (0 for success)
 */
tsanalyzer_int_t tsanalyzer_cmd_explain(const tsanalyzer_context_t *ctx);

/**
 * @brief Handle the 'version' command
 *
 * @param ctx Context containing parsed arguments
 * @return tsanalyzer_int_t Exit code (0 for success)
 */
tsanalyzer_int_t tsanalyzer_cmd_version(const tsanalyzer_context_t *ctx);

/**
 * @brief Handle the 'help' command
 *
 * @param ctx Context containing parsed arguments
 * @return tsanalyzer_int_t Exit code (0 for success)
 */
tsanalyzer_int_t tsanalyzer_cmd_help(const tsanalyzer_context_t *ctx);

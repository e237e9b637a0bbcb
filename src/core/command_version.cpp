/**
 * @file command_version.cpp
 * @brief Implementation of the 'version' command
 */

#include "core/commands.hpp"
#include "core/constants.h"
#include "tsanalyzer/log.hpp"

#include <string>

using namespace tsanalyzer;

/**
 * @brief Display tsanalyzer version information
 *
 * @param ctx Context containing parsed arguments
 * @return tsanalyzer_int_t Exit code (0 for success)
 */
tsanalyzer_int_t tsanalyzer_cmd_version(const tsanalyzer_context_t *ctx) {
  (void)ctx;
  logger::print_plain("tsanalyzer " + std::string(TSANALYZER_VERSION));
  logger::print_plain("Fix suggestions for TypeScript compiler diagnostics");
  return 0;
}

/**
 * @file config.hpp
 * @brief tsanalyzer.toml configuration
 *
 * Example:
 *   [output]
 *   color = false
 *   show_source = true
 *   verbosity = "verbose"
 *   summary = true
 *
 *   [analyzer]
 *   extended_codes = true
 *   ignore = ["TS7006"]
 */

#pragma once

#include "core/diagnostic_parser.hpp"
#include "core/toml_reader.hpp"

#include <string>
#include <vector>

namespace tsanalyzer {

/**
 * @brief Settings for one analysis run
 */
struct analyzer_config {
  bool color = true;
  bool show_source = true;
  bool summary = true;
  std::string verbosity = "normal";
  bool extended_codes = false;
  std::vector<std::string> ignore_codes;

  /**
   * @brief Whether a diagnostic with this code is skipped
   *
   * Entries are classified before comparison, so ignoring one code of a
   * category ignores its aliases too. Unknown entries match only the
   * identical raw code.
   */
  bool is_ignored(const error_code &code) const;
};

/**
 * @brief Apply the values present in a parsed document onto config
 *
 * Keys missing from the document leave the current values untouched.
 * An unknown verbosity string is reported and ignored.
 */
void apply_config(const toml_reader &reader, analyzer_config &config);

/**
 * @brief Load a configuration file onto config
 *
 * @param path Path to the TOML file
 * @param config Settings to update
 * @return False when the file is missing or invalid
 */
bool load_config_file(const std::string &path, analyzer_config &config);

} // namespace tsanalyzer

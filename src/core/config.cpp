/**
 * @file config.cpp
 * @brief Implementation of configuration loading
 */

#include "core/config.hpp"
#include "tsanalyzer/log.hpp"

#include <algorithm>

namespace tsanalyzer {

bool analyzer_config::is_ignored(const error_code &code) const {
  return std::any_of(ignore_codes.begin(), ignore_codes.end(),
                     [&](const std::string &entry) {
                       return classify_error_code(entry, extended_codes) == code;
                     });
}

void apply_config(const toml_reader &reader, analyzer_config &config) {
  config.color = reader.get_bool("output.color", config.color);
  config.show_source = reader.get_bool("output.show_source", config.show_source);
  config.summary = reader.get_bool("output.summary", config.summary);

  if (reader.has_key("output.verbosity")) {
    std::string verbosity = reader.get_string("output.verbosity");
    if (verbosity == "quiet" || verbosity == "normal" ||
        verbosity == "verbose") {
      config.verbosity = verbosity;
    } else {
      logger::print_warning("Unknown verbosity '" + verbosity +
                            "' in configuration, keeping '" +
                            config.verbosity + "'");
    }
  }

  config.extended_codes =
      reader.get_bool("analyzer.extended_codes", config.extended_codes);

  if (reader.has_key("analyzer.ignore")) {
    config.ignore_codes = reader.get_string_array("analyzer.ignore");
  }
}

bool load_config_file(const std::string &path, analyzer_config &config) {
  toml_reader reader;
  if (!reader.load(path)) {
    return false;
  }

  apply_config(reader, config);
  logger::print_verbose("Loaded configuration from " + path);
  return true;
}

} // namespace tsanalyzer

/**
 * @file toml_reader.hpp
 * @brief Dotted-key access to TOML documents via toml++
 */

#ifndef TSANALYZER_TOML_READER_H
#define TSANALYZER_TOML_READER_H

#include <memory>
#include <string>
#include <vector>

#include "core/types.h"

#include <toml++/toml.hpp>

namespace tsanalyzer {

/**
 * @brief Owns one parsed TOML document
 *
 * Keys are dotted paths ("output.color"). Lookups on a missing key, on a
 * value of another type, or before a successful load return the default.
 * Parse failures are reported through the logger, never thrown.
 */
class toml_reader {
public:
  toml_reader();
  ~toml_reader();

  toml_reader(const toml_reader &) = delete;
  toml_reader &operator=(const toml_reader &) = delete;

  /**
   * @brief Parse a file, replacing any loaded document
   * @return False if the file is missing or not valid TOML
   */
  bool load(const std::string &filepath);

  /**
   * @brief Parse document text, replacing any loaded document
   * @param source_name Shown in parse error messages
   */
  bool parse(const std::string &content,
             const std::string &source_name = "<string>");

  std::string get_string(const std::string &key,
                         const std::string &default_value = "") const;

  bool get_bool(const std::string &key, bool default_value = false) const;

  /**
   * @brief String elements of an array; other elements are skipped
   */
  std::vector<std::string> get_string_array(const std::string &key) const;

  bool has_key(const std::string &key) const;

private:
  std::unique_ptr<toml::table> toml_data;

  // Empty view when nothing is loaded or the key is absent
  toml::node_view<toml::node> node_at(const std::string &key) const;
};

} // namespace tsanalyzer

#endif // TSANALYZER_TOML_READER_H

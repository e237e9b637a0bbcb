/**
 * @file toml_reader.cpp
 * @brief Implementation of the toml++ wrapper
 */

#include "core/toml_reader.hpp"
#include "tsanalyzer/log.hpp"

#include <filesystem>

#include <fmt/core.h>

namespace tsanalyzer {

namespace {

void report_parse_error(const std::string &source, const toml::parse_error &err) {
  logger::print_error(fmt::format("{}:{}:{}: {}", source,
                                  err.source().begin.line,
                                  err.source().begin.column,
                                  err.description()));
}

} // namespace

toml_reader::toml_reader() = default;

toml_reader::~toml_reader() = default;

bool toml_reader::load(const std::string &filepath) {
  toml_data.reset();

  if (!std::filesystem::exists(filepath)) {
    logger::print_error("Configuration file not found: " + filepath);
    return false;
  }

  try {
    toml_data = std::make_unique<toml::table>(toml::parse_file(filepath));
  } catch (const toml::parse_error &err) {
    report_parse_error(filepath, err);
    return false;
  }
  return true;
}

bool toml_reader::parse(const std::string &content,
                        const std::string &source_name) {
  toml_data.reset();

  try {
    toml_data = std::make_unique<toml::table>(
        toml::parse(std::string_view(content), std::string_view(source_name)));
  } catch (const toml::parse_error &err) {
    report_parse_error(source_name, err);
    return false;
  }
  return true;
}

toml::node_view<toml::node> toml_reader::node_at(const std::string &key) const {
  if (!toml_data) {
    return {};
  }
  return toml_data->at_path(key);
}

std::string toml_reader::get_string(const std::string &key,
                                    const std::string &default_value) const {
  return node_at(key).value_exact<std::string>().value_or(default_value);
}

bool toml_reader::get_bool(const std::string &key, bool default_value) const {
  return node_at(key).value_exact<bool>().value_or(default_value);
}

std::vector<std::string>
toml_reader::get_string_array(const std::string &key) const {
  std::vector<std::string> result;

  const toml::array *array = node_at(key).as_array();
  if (!array) {
    return result;
  }

  for (const auto &element : *array) {
    if (auto text = element.value_exact<std::string>()) {
      result.push_back(*text);
    }
  }
  return result;
}

bool toml_reader::has_key(const std::string &key) const {
  return static_cast<bool>(node_at(key));
}

} // namespace tsanalyzer

/**
 * @file command_analyze.cpp
 * @brief Implementation of the 'analyze' command
 */

#include "core/commands.hpp"
#include "core/config.hpp"
#include "core/constants.h"
#include "core/diagnostic_parser.hpp"
#include "core/suggestion.hpp"
#include "core/suggestion_format.hpp"
#include "core/tokenizer.hpp"
#include "tsanalyzer/log.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/core.h>

using namespace tsanalyzer;

namespace {

/**
 * @brief Resolve configuration: explicit file, default file, then CLI flags
 */
bool resolve_config(const tsanalyzer_context_t *ctx, analyzer_config &config) {
  if (ctx->args.config) {
    if (!load_config_file(ctx->args.config, config)) {
      return false;
    }
  } else if (std::filesystem::exists(TSANALYZER_CONFIG_FILE)) {
    if (!load_config_file(TSANALYZER_CONFIG_FILE, config)) {
      return false;
    }
  }

  if (ctx->args.no_color) {
    config.color = false;
  }
  if (ctx->args.extended) {
    config.extended_codes = true;
  }
  if (ctx->args.verbosity) {
    config.verbosity = ctx->args.verbosity;
  }
  return true;
}

bool read_input(const std::string &path, std::string &output) {
  std::stringstream buffer;

  if (path == TSANALYZER_STDIN_PATH) {
    buffer << std::cin.rdbuf();
  } else {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
      logger::print_error("Could not open " + path);
      return false;
    }
    buffer << file.rdbuf();
  }

  output = buffer.str();
  return true;
}

} // namespace

tsanalyzer_int_t tsanalyzer_cmd_analyze(const tsanalyzer_context_t *ctx) {
  analyzer_config config;
  if (!resolve_config(ctx, config)) {
    return 1;
  }

  tsanalyzer_set_verbosity(config.verbosity.c_str());
  logger::set_color(config.color);

  std::string input_path =
      ctx->args.arg_count > 0 ? ctx->args.args[0] : TSANALYZER_STDIN_PATH;

  std::string output;
  if (!read_input(input_path, output)) {
    return 1;
  }

  logger::analyzing(input_path == TSANALYZER_STDIN_PATH ? "<stdin>"
                                                        : input_path);

  std::vector<ts_error> errors =
      parse_diagnostic_output(output, config.extended_codes);
  if (errors.empty()) {
    logger::print_status("No diagnostics found in input");
    return 0;
  }

  synthesis_options synth_options;
  synth_options.colorize = config.color;

  render_options render;
  render.color = config.color;
  render.show_source = config.show_source;

  // Each source file is tokenized once per run
  std::map<std::string, std::vector<token>> token_cache;
  analysis_summary summary;

  for (const auto &err : errors) {
    if (config.is_ignored(err.code)) {
      logger::print_verbose("Ignoring " + err.code.to_string() + " at " +
                            err.file + ":" + std::to_string(err.line));
      continue;
    }

    auto cached = token_cache.find(err.file);
    if (cached == token_cache.end()) {
      logger::tokenizing(err.file);
      std::vector<token> tokens = tokenize_file(err.file);
      if (tokens.empty()) {
        logger::print_verbose("No tokens for " + err.file +
                              ", using message text only");
      }
      cached = token_cache.emplace(err.file, std::move(tokens)).first;
    }

    auto result = synthesize_suggestion(err, cached->second, synth_options);
    std::string source_line =
        render.show_source ? read_source_line(err.file, err.line) : "";

    fmt::print("{}", format_analysis_to_string(err, result, source_line,
                                               cached->second, render));
    record_analysis(summary, err, result.has_value());
  }

  if (config.summary) {
    std::string summary_str = format_analysis_summary(summary);
    if (!summary_str.empty()) {
      fmt::print("{}", summary_str);
    }
  }

  logger::finished(fmt::format("{} of {} diagnostics with suggestions",
                               summary.with_suggestion, summary.total));
  return 0;
}

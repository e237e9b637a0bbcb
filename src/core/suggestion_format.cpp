/**
 * @file suggestion_format.cpp
 * @brief Implementation of analysis rendering
 */

#include "core/suggestion_format.hpp"
#include "core/message_extract.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

#include "fmt/color.h"
#include "fmt/core.h"
#include "fmt/format.h"

namespace tsanalyzer {

namespace {

// Applies a style only when colors are enabled
std::string paint(const render_options &options, const fmt::text_style &style,
                  const std::string &text) {
  if (!options.color) {
    return text;
  }
  return fmt::format(style, "{}", text);
}

// Caret column (0-based), kept within one past the end of the line
tsanalyzer_size_t caret_start(const ts_error &err, tsanalyzer_size_t line_length) {
  if (err.column == 0) {
    return 0;
  }
  tsanalyzer_size_t start = err.column - 1;
  return start > line_length ? line_length : start;
}

// Width of the caret run: the token under the column, or one character.
// The run never extends past the end of the line.
tsanalyzer_size_t caret_width(const ts_error &err,
                              const std::vector<token> &tokens,
                              tsanalyzer_size_t start,
                              tsanalyzer_size_t line_length) {
  const token *tok = find_token_at(tokens, err.line, err.column);
  if (!tok || start >= line_length) {
    return 1;
  }

  // The caret starts at the error column, which may be inside the token
  tsanalyzer_size_t token_end = tok->column + utf8_length(tok->raw);
  if (token_end > line_length) {
    token_end = line_length;
  }
  return token_end > start ? token_end - start : 1;
}

} // namespace

std::string read_source_line(const std::string &file_path,
                             tsanalyzer_uint_t line_number) {
  if (file_path.empty() || line_number == 0) {
    return "";
  }

  std::ifstream file(file_path);
  if (!file.is_open()) {
    return "";
  }

  std::string line;
  tsanalyzer_uint_t current_line = 0;
  while (std::getline(file, line)) {
    current_line++;
    if (current_line == line_number) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      return line;
    }
  }

  return "";
}

std::string format_analysis_to_string(const ts_error &err,
                                      const std::optional<suggestion> &result,
                                      const std::string &source_line,
                                      const std::vector<token> &tokens,
                                      const render_options &options) {
  std::stringstream ss;

  const auto error_style = fg(fmt::color::red) | fmt::emphasis::bold;
  const auto gutter_style = fg(fmt::color::cyan);

  // Header: "error[TS2322]: Type 'string' is not assignable ..."
  ss << paint(options, error_style, "error");
  ss << paint(options, error_style, "[" + err.code.to_string() + "]");
  ss << paint(options, fg(fmt::color::white) | fmt::emphasis::bold,
              ": " + err.message)
     << "\n";

  // Location: "  --> src/app.ts:10:5"
  ss << paint(options, gutter_style, "  --> ");
  ss << err.file << ":" << err.line << ":" << err.column << "\n";

  tsanalyzer_size_t gutter_width = std::to_string(err.line).length();
  if (gutter_width < 2)
    gutter_width = 2;
  std::string blank_gutter(gutter_width, ' ');

  if (options.show_source && !source_line.empty() && err.line > 0) {
    ss << paint(options, gutter_style, blank_gutter + " |") << "\n";
    ss << paint(options, gutter_style,
                fmt::format("{:>{}} | ", err.line, gutter_width));
    ss << source_line << "\n";

    ss << paint(options, gutter_style, blank_gutter + " | ");
    tsanalyzer_size_t line_length = utf8_length(source_line);
    tsanalyzer_size_t start = caret_start(err, line_length);
    ss << std::string(start, ' ');
    ss << paint(options, error_style,
                std::string(caret_width(err, tokens, start, line_length), '^'));
    ss << "\n";
  }

  const std::string indent = blank_gutter + " = ";

  if (!result) {
    ss << paint(options, fg(fmt::color::cyan) | fmt::emphasis::bold,
                indent + "note: ");
    ss << "no suggestion available for " << err.code.to_string() << " ("
       << error_kind_name(err.code.kind) << ")\n";
    ss << "\n";
    return ss.str();
  }

  for (const auto &line : result->suggestions) {
    ss << paint(options, fg(fmt::color::magenta) | fmt::emphasis::bold,
                indent + "suggestion: ");
    ss << line << "\n";
  }

  if (result->help) {
    ss << paint(options, fg(fmt::color::green) | fmt::emphasis::bold,
                indent + "help: ");
    ss << *result->help << "\n";
  }

  ss << "\n";
  return ss.str();
}

void record_analysis(analysis_summary &summary, const ts_error &err,
                     bool has_suggestion) {
  summary.total++;
  if (has_suggestion) {
    summary.with_suggestion++;
  } else {
    summary.without_suggestion++;
  }
  summary.categories[error_kind_name(err.code.kind)]++;
}

std::string format_analysis_summary(const analysis_summary &summary) {
  if (summary.total == 0) {
    return "";
  }

  std::stringstream ss;
  ss << summary.total << (summary.total == 1 ? " diagnostic" : " diagnostics")
     << " analyzed, " << summary.with_suggestion << " with suggestions, "
     << summary.without_suggestion << " without\n";

  // Most frequent categories first, ties by name
  std::vector<std::pair<std::string, int>> categories(
      summary.categories.begin(), summary.categories.end());
  std::stable_sort(categories.begin(), categories.end(),
                   [](const auto &a, const auto &b) { return a.second > b.second; });

  for (const auto &category : categories) {
    ss << fmt::format("{:>6} {}\n", category.second, category.first);
  }

  return ss.str();
}

} // namespace tsanalyzer

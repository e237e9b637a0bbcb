/**
 * @file log.cpp
 * @brief Status-line logging implementation
 *
 * Examples:
 *      Analyzing build.log
 *     Tokenizing src/app.ts
 *       Finished 3 of 4 diagnostics with suggestions
 *          error: Could not open build.log
 */

#include "tsanalyzer/log.hpp"

namespace tsanalyzer {

log_verbosity logger::s_verbosity = log_verbosity::VERBOSITY_NORMAL;
bool logger::s_color = true;

void logger::set_verbosity(log_verbosity level) { s_verbosity = level; }

void logger::set_color(bool enabled) { s_color = enabled; }

bool logger::enabled(log_verbosity minimum) {
  return static_cast<int>(s_verbosity) >= static_cast<int>(minimum);
}

void logger::print_status_line(const std::string &status,
                               const std::string &message,
                               fmt::color status_color, bool is_bold) {
  if (!s_color) {
    fmt::print(stderr, "{:>{}} {}\n", status, STATUS_WIDTH, message);
    return;
  }

  fmt::text_style style = fg(status_color);
  if (is_bold) {
    style |= fmt::emphasis::bold;
  }
  fmt::print(stderr, style, "{:>{}}", status, STATUS_WIDTH);
  fmt::print(stderr, " {}\n", message);
}

void logger::print_action(const std::string &action,
                          const std::string &message) {
  if (enabled(log_verbosity::VERBOSITY_NORMAL))
    print_status_line(action, message, fmt::color::green);
}

void logger::print_status(const std::string &message) {
  if (enabled(log_verbosity::VERBOSITY_NORMAL))
    print_status_line("", message, fmt::color::cyan);
}

void logger::print_warning(const std::string &message) {
  if (enabled(log_verbosity::VERBOSITY_NORMAL))
    print_status_line("warning", message, fmt::color::yellow);
}

void logger::print_error(const std::string &message) {
  print_status_line("error", message, fmt::color::red);
}

void logger::print_verbose(const std::string &message) {
  if (enabled(log_verbosity::VERBOSITY_VERBOSE))
    print_status_line("", message, fmt::color::gray, false);
}

void logger::analyzing(const std::string &target) {
  print_action("Analyzing", target);
}

void logger::tokenizing(const std::string &file) {
  if (enabled(log_verbosity::VERBOSITY_VERBOSE))
    print_status_line("Tokenizing", file, fmt::color::green);
}

void logger::finished(const std::string &summary) {
  print_action("Finished", summary);
}

void logger::print_plain(const std::string &message) {
  fmt::print("{}\n", message);
}

void logger::print_lines(const std::vector<std::string> &messages) {
  for (const auto &message : messages) {
    fmt::print("{}\n", message);
  }
}

} // namespace tsanalyzer

extern "C" void tsanalyzer_set_verbosity_impl(tsanalyzer_log_verbosity_t level) {
  switch (level) {
  case TSANALYZER_VERBOSITY_QUIET:
    tsanalyzer::logger::set_verbosity(tsanalyzer::log_verbosity::VERBOSITY_QUIET);
    break;
  case TSANALYZER_VERBOSITY_VERBOSE:
    tsanalyzer::logger::set_verbosity(tsanalyzer::log_verbosity::VERBOSITY_VERBOSE);
    break;
  default:
    tsanalyzer::logger::set_verbosity(tsanalyzer::log_verbosity::VERBOSITY_NORMAL);
    break;
  }
}

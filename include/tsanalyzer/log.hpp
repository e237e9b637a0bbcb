/**
 * @file log.hpp
 * @brief Status-line logging for tsanalyzer
 *
 * Every status line is a right-aligned, colored word followed by the
 * message, the way Cargo reports progress:
 *
 *      Analyzing build.log
 *       Finished 3 of 4 diagnostics with suggestions
 */

#ifndef TSANALYZER_LOG_HPP
#define TSANALYZER_LOG_HPP

#include "core/types.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Verbosity levels visible to the C argument layer
 */
typedef enum {
  TSANALYZER_VERBOSITY_QUIET,   /**< errors only */
  TSANALYZER_VERBOSITY_NORMAL,  /**< status lines */
  TSANALYZER_VERBOSITY_VERBOSE  /**< status lines plus trace */
} tsanalyzer_log_verbosity_t;

void tsanalyzer_set_verbosity_impl(tsanalyzer_log_verbosity_t level);

#ifdef __cplusplus
} // extern "C"

#include <fmt/color.h>
#include <fmt/core.h>
#include <string>
#include <vector>

namespace tsanalyzer {

enum class log_verbosity { VERBOSITY_QUIET, VERBOSITY_NORMAL, VERBOSITY_VERBOSE };

/**
 * @class logger
 * @brief Process-wide status output on stderr
 *
 * Plain output goes to stdout. Nothing here is thread-safe; the tool logs
 * from one thread.
 */
class logger {
public:
  static void set_verbosity(log_verbosity level);

  /**
   * @brief Enable or disable ANSI colors on status words
   */
  static void set_color(bool enabled);

  /**
   * @brief "{action:>12} {message}" with a green action word
   */
  static void print_action(const std::string &action,
                           const std::string &message);

  static void print_status(const std::string &message);
  static void print_warning(const std::string &message);

  /**
   * @brief Always printed, even when quiet
   */
  static void print_error(const std::string &message);

  /**
   * @brief Gray trace line, only printed when verbose
   */
  static void print_verbose(const std::string &message);

  static void analyzing(const std::string &target);
  static void tokenizing(const std::string &file);
  static void finished(const std::string &summary);

  /**
   * @brief Write to stdout without a status word
   */
  static void print_plain(const std::string &message);
  static void print_lines(const std::vector<std::string> &messages);

private:
  static log_verbosity s_verbosity;
  static bool s_color;

  static constexpr int STATUS_WIDTH = 12;

  static bool enabled(log_verbosity minimum);

  static void print_status_line(const std::string &status,
                                const std::string &message,
                                fmt::color status_color, bool is_bold = true);
};

} // namespace tsanalyzer
#endif

#endif // TSANALYZER_LOG_HPP

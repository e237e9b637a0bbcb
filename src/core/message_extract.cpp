/**
 * @file message_extract.cpp
 * @brief Implementation of message extraction helpers
 */

#include "core/message_extract.hpp"

namespace tsanalyzer {

static const char *ARGUMENT_MARKER = "Argument of type '";
static const char *PARAMETER_MARKER = "to parameter of type '";

static std::string trim(const std::string &text) {
  const char *whitespace = " \t\r\n";
  tsanalyzer_size_t start = text.find_first_not_of(whitespace);
  if (start == std::string::npos) {
    return "";
  }
  tsanalyzer_size_t end = text.find_last_not_of(whitespace);
  return text.substr(start, end - start + 1);
}

std::vector<std::string> split_quoted(const std::string &message) {
  std::vector<std::string> parts;

  tsanalyzer_size_t start = 0;
  while (true) {
    tsanalyzer_size_t quote = message.find('\'', start);
    if (quote == std::string::npos) {
      parts.push_back(message.substr(start));
      break;
    }
    parts.push_back(message.substr(start, quote - start));
    start = quote + 1;
  }

  return parts;
}

std::string quoted_part(const std::string &message, tsanalyzer_size_t index,
                        const std::string &placeholder) {
  std::vector<std::string> parts = split_quoted(message);
  if (index >= parts.size()) {
    return placeholder;
  }
  return parts[index];
}

const token *find_token_at(const std::vector<token> &tokens,
                           tsanalyzer_uint_t line, tsanalyzer_uint_t column) {
  // Diagnostic columns are 1-based; column 0 can not match anything
  if (column == 0) {
    return nullptr;
  }
  tsanalyzer_size_t target = column - 1;

  for (const auto &tok : tokens) {
    if (tok.line != line) {
      continue;
    }
    tsanalyzer_size_t begin = tok.column;
    tsanalyzer_size_t end = begin + utf8_length(tok.raw);
    if (target >= begin && target < end) {
      return &tok;
    }
  }

  return nullptr;
}

std::optional<std::pair<std::string, std::string>>
parse_assignment_types(const std::string &message) {
  // The marker must be preceded by at least one character ("Type", "type")
  tsanalyzer_size_t marker = message.find("ype '", 1);
  if (marker == std::string::npos) {
    return std::nullopt;
  }

  tsanalyzer_size_t from_start = marker + 5;
  tsanalyzer_size_t from_end = message.find('\'', from_start);
  if (from_end == std::string::npos) {
    return std::nullopt;
  }

  tsanalyzer_size_t to_open = message.find('\'', from_end + 1);
  if (to_open == std::string::npos) {
    return std::nullopt;
  }

  tsanalyzer_size_t to_start = to_open + 1;
  tsanalyzer_size_t to_end = message.find('\'', to_start);
  std::string to = to_end == std::string::npos
                       ? message.substr(to_start)
                       : message.substr(to_start, to_end - to_start);

  return std::make_pair(message.substr(from_start, from_end - from_start), to);
}

std::optional<std::string> parse_missing_property_type(const std::string &message) {
  const std::string marker = "type '";
  tsanalyzer_size_t start = message.rfind(marker);
  if (start == std::string::npos) {
    return std::nullopt;
  }

  start += marker.size();
  tsanalyzer_size_t end = message.find('\'', start);
  if (end == std::string::npos) {
    return std::nullopt;
  }
  return message.substr(start, end - start);
}

std::optional<std::string> extract_object_type(const std::string &message,
                                               const std::string &marker) {
  tsanalyzer_size_t start = message.find(marker);
  if (start == std::string::npos) {
    return std::nullopt;
  }

  start += marker.size();
  tsanalyzer_size_t end = message.find('\'', start);
  if (end == std::string::npos) {
    return std::nullopt;
  }
  return message.substr(start, end - start);
}

std::map<std::string, std::string>
parse_object_properties(const std::string &object_type) {
  std::map<std::string, std::string> props;

  std::string literal = trim(object_type);
  if (literal.size() < 2 || literal.front() != '{' || literal.back() != '}') {
    return props;
  }

  std::string inner = literal.substr(1, literal.size() - 2);

  tsanalyzer_size_t start = 0;
  while (start <= inner.size()) {
    tsanalyzer_size_t semi = inner.find(';', start);
    std::string clause = trim(semi == std::string::npos
                                  ? inner.substr(start)
                                  : inner.substr(start, semi - start));

    if (!clause.empty()) {
      tsanalyzer_size_t colon = clause.find(':');
      if (colon != std::string::npos) {
        props[trim(clause.substr(0, colon))] = trim(clause.substr(colon + 1));
      }
    }

    if (semi == std::string::npos) {
      break;
    }
    start = semi + 1;
  }

  return props;
}

std::optional<std::vector<property_mismatch>>
diff_argument_object_types(const std::string &message) {
  auto provided_obj = extract_object_type(message, ARGUMENT_MARKER);
  if (!provided_obj) {
    return std::nullopt;
  }
  auto expected_obj = extract_object_type(message, PARAMETER_MARKER);
  if (!expected_obj) {
    return std::nullopt;
  }

  auto provided = parse_object_properties(*provided_obj);
  auto expected = parse_object_properties(*expected_obj);

  // std::map iterates by property name, which keeps the output stable
  std::vector<property_mismatch> mismatches;
  for (const auto &entry : expected) {
    auto it = provided.find(entry.first);
    if (it != provided.end() && it->second != entry.second) {
      mismatches.push_back({entry.first, it->second, entry.second});
    }
  }

  return mismatches;
}

} // namespace tsanalyzer

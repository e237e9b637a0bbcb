/**
 * @file diagnostic_parser.cpp
 * @brief Implementation of diagnostic parsing and code classification
 */

#include "core/diagnostic_parser.hpp"

#include <cctype>
#include <climits>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace tsanalyzer {

namespace {

// Codes from the compiler's diagnostic catalogue. Several codes alias to
// one category.
const std::unordered_map<std::string, error_kind> CODE_TABLE = {
    {"TS2322", error_kind::TYPE_MISMATCH},
    {"TS2345", error_kind::INLINE_TYPE_MISMATCH},
    {"TS2554", error_kind::MISSING_PARAMETERS},
    {"TS7006", error_kind::NO_IMPLICIT_ANY},
    {"TS7044", error_kind::NO_IMPLICIT_ANY},
    {"TS2741", error_kind::PROPERTY_MISSING_IN_TYPE},
    {"TS2367", error_kind::UNINTENTIONAL_COMPARISON},
    {"TS18046", error_kind::OBJECT_IS_UNKNOWN},
    {"TS2339", error_kind::PROPERTY_DOES_NOT_EXIST},
    {"TS2532", error_kind::OBJECT_POSSIBLY_UNDEFINED},
    {"TS18048", error_kind::OBJECT_POSSIBLY_UNDEFINED},
    {"TS2531", error_kind::OBJECT_POSSIBLY_NULL},
    {"TS18047", error_kind::OBJECT_POSSIBLY_NULL},
    {"TS2352", error_kind::DIRECT_CAST_POTENTIALLY_MISTAKEN},
    {"TS2556", error_kind::SPREAD_ARGUMENT_MUST_BE_TUPLE},
    {"TS2363", error_kind::RIGHT_SIDE_ARITHMETIC_MUST_BE_NUMBER},
    {"TS2394", error_kind::INCOMPATIBLE_OVERLOAD},
    {"TS2451", error_kind::INVALID_SHADOW_IN_SCOPE},
    {"TS2307", error_kind::NON_EXISTENT_MODULE_IMPORT},
    {"TS2540", error_kind::READONLY_PROPERTY_ASSIGNMENT},
    {"TS2420", error_kind::INCORRECT_INTERFACE_IMPLEMENTATION},
};

// Only consulted when the extended table is enabled
const std::unordered_map<std::string, error_kind> EXTENDED_CODE_TABLE = {
    {"TS2362", error_kind::LEFT_SIDE_ARITHMETIC_MUST_BE_NUMBER},
    {"TS2416", error_kind::PROPERTY_NOT_ASSIGNABLE_TO_BASE},
    {"TS2304", error_kind::CANNOT_FIND_IDENTIFIER},
    {"TS2355", error_kind::MISSING_RETURN_VALUE},
    {"TS2349", error_kind::UNCALLABLE_EXPRESSION},
    {"TS2538", error_kind::INVALID_INDEX_TYPE},
    {"TS2551", error_kind::TYPO_PROPERTY_ON_TYPE},
};

// Split once on the first occurrence of sep
bool split_once(const std::string &text, const std::string &sep,
                std::string &head, std::string &tail) {
  tsanalyzer_size_t pos = text.find(sep);
  if (pos == std::string::npos) {
    return false;
  }
  head = text.substr(0, pos);
  tail = text.substr(pos + sep.size());
  return true;
}

// Digits only; no sign, no whitespace, no trailing text
bool parse_coordinate(const std::string &text, tsanalyzer_uint_t &out) {
  if (text.empty()) {
    return false;
  }
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }

  try {
    unsigned long long value = std::stoull(text, nullptr, 10);
    if (value > UINT_MAX) {
      return false;
    }
    out = static_cast<tsanalyzer_uint_t>(value);
  } catch (const std::out_of_range &) {
    return false;
  }
  return true;
}

} // namespace

error_code error_code::of(error_kind kind) {
  error_code code;
  code.kind = kind;
  return code;
}

error_code error_code::unsupported(const std::string &raw) {
  error_code code;
  code.kind = error_kind::UNSUPPORTED;
  code.unsupported_code = raw;
  return code;
}

std::string error_code::to_string() const {
  switch (kind) {
  case error_kind::TYPE_MISMATCH:
    return "TS2322";
  case error_kind::INLINE_TYPE_MISMATCH:
    return "TS2345";
  case error_kind::MISSING_PARAMETERS:
    return "TS2554";
  case error_kind::NO_IMPLICIT_ANY:
    return "TS7006";
  case error_kind::PROPERTY_MISSING_IN_TYPE:
    return "TS2741";
  case error_kind::UNINTENTIONAL_COMPARISON:
    return "TS2367";
  case error_kind::PROPERTY_DOES_NOT_EXIST:
    return "TS2339";
  case error_kind::OBJECT_POSSIBLY_UNDEFINED:
    return "TS2532";
  case error_kind::OBJECT_POSSIBLY_NULL:
    return "TS2531";
  case error_kind::OBJECT_IS_UNKNOWN:
    return "TS18046";
  case error_kind::DIRECT_CAST_POTENTIALLY_MISTAKEN:
    return "TS2352";
  case error_kind::SPREAD_ARGUMENT_MUST_BE_TUPLE:
    return "TS2556";
  case error_kind::RIGHT_SIDE_ARITHMETIC_MUST_BE_NUMBER:
    return "TS2363";
  case error_kind::INCOMPATIBLE_OVERLOAD:
    return "TS2394";
  case error_kind::INVALID_SHADOW_IN_SCOPE:
    return "TS2451";
  case error_kind::NON_EXISTENT_MODULE_IMPORT:
    return "TS2307";
  case error_kind::READONLY_PROPERTY_ASSIGNMENT:
    return "TS2540";
  case error_kind::INCORRECT_INTERFACE_IMPLEMENTATION:
    return "TS2420";
  case error_kind::LEFT_SIDE_ARITHMETIC_MUST_BE_NUMBER:
    return "TS2362";
  case error_kind::PROPERTY_NOT_ASSIGNABLE_TO_BASE:
    return "TS2416";
  case error_kind::CANNOT_FIND_IDENTIFIER:
    return "TS2304";
  case error_kind::MISSING_RETURN_VALUE:
    return "TS2355";
  case error_kind::UNCALLABLE_EXPRESSION:
    return "TS2349";
  case error_kind::INVALID_INDEX_TYPE:
    return "TS2538";
  case error_kind::TYPO_PROPERTY_ON_TYPE:
    return "TS2551";
  case error_kind::UNSUPPORTED:
    return unsupported_code;
  }
  return unsupported_code;
}

bool error_code::operator==(const error_code &other) const {
  if (kind != other.kind) {
    return false;
  }
  return kind != error_kind::UNSUPPORTED ||
         unsupported_code == other.unsupported_code;
}

const char *error_kind_name(error_kind kind) {
  switch (kind) {
  case error_kind::TYPE_MISMATCH:
    return "type-mismatch";
  case error_kind::INLINE_TYPE_MISMATCH:
    return "inline-type-mismatch";
  case error_kind::MISSING_PARAMETERS:
    return "missing-parameters";
  case error_kind::NO_IMPLICIT_ANY:
    return "no-implicit-any";
  case error_kind::PROPERTY_MISSING_IN_TYPE:
    return "property-missing-in-type";
  case error_kind::UNINTENTIONAL_COMPARISON:
    return "unintentional-comparison";
  case error_kind::PROPERTY_DOES_NOT_EXIST:
    return "property-does-not-exist";
  case error_kind::OBJECT_POSSIBLY_UNDEFINED:
    return "object-possibly-undefined";
  case error_kind::OBJECT_POSSIBLY_NULL:
    return "object-possibly-null";
  case error_kind::OBJECT_IS_UNKNOWN:
    return "object-is-unknown";
  case error_kind::DIRECT_CAST_POTENTIALLY_MISTAKEN:
    return "direct-cast-potentially-mistaken";
  case error_kind::SPREAD_ARGUMENT_MUST_BE_TUPLE:
    return "spread-argument-must-be-tuple";
  case error_kind::RIGHT_SIDE_ARITHMETIC_MUST_BE_NUMBER:
    return "right-side-arithmetic-must-be-number";
  case error_kind::INCOMPATIBLE_OVERLOAD:
    return "incompatible-overload";
  case error_kind::INVALID_SHADOW_IN_SCOPE:
    return "invalid-shadow-in-scope";
  case error_kind::NON_EXISTENT_MODULE_IMPORT:
    return "non-existent-module-import";
  case error_kind::READONLY_PROPERTY_ASSIGNMENT:
    return "readonly-property-assignment";
  case error_kind::INCORRECT_INTERFACE_IMPLEMENTATION:
    return "incorrect-interface-implementation";
  case error_kind::LEFT_SIDE_ARITHMETIC_MUST_BE_NUMBER:
    return "left-side-arithmetic-must-be-number";
  case error_kind::PROPERTY_NOT_ASSIGNABLE_TO_BASE:
    return "property-not-assignable-to-base";
  case error_kind::CANNOT_FIND_IDENTIFIER:
    return "cannot-find-identifier";
  case error_kind::MISSING_RETURN_VALUE:
    return "missing-return-value";
  case error_kind::UNCALLABLE_EXPRESSION:
    return "uncallable-expression";
  case error_kind::INVALID_INDEX_TYPE:
    return "invalid-index-type";
  case error_kind::TYPO_PROPERTY_ON_TYPE:
    return "typo-property-on-type";
  case error_kind::UNSUPPORTED:
    return "unsupported";
  }
  return "unsupported";
}

error_code classify_error_code(const std::string &code, bool extended) {
  auto it = CODE_TABLE.find(code);
  if (it != CODE_TABLE.end()) {
    return error_code::of(it->second);
  }

  if (extended) {
    auto ext = EXTENDED_CODE_TABLE.find(code);
    if (ext != EXTENDED_CODE_TABLE.end()) {
      return error_code::of(ext->second);
    }
  }

  return error_code::unsupported(code);
}

std::optional<ts_error> parse_diagnostic(const std::string &line,
                                         bool extended_codes) {
  std::string file, rest;
  if (!split_once(line, "(", file, rest)) {
    return std::nullopt;
  }

  std::string coords, tail;
  if (!split_once(rest, "): error ", coords, tail)) {
    return std::nullopt;
  }

  std::string line_str, column_str;
  if (!split_once(coords, ",", line_str, column_str)) {
    return std::nullopt;
  }

  std::string code, message;
  if (!split_once(tail, ": ", code, message)) {
    return std::nullopt;
  }

  ts_error err;
  if (!parse_coordinate(line_str, err.line) ||
      !parse_coordinate(column_str, err.column)) {
    return std::nullopt;
  }

  err.file = file;
  err.code = classify_error_code(code, extended_codes);
  err.message = message;
  return err;
}

std::vector<ts_error> parse_diagnostic_output(const std::string &output,
                                              bool extended_codes) {
  std::vector<ts_error> errors;

  std::string line;
  std::istringstream stream(output);
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    auto err = parse_diagnostic(line, extended_codes);
    if (err) {
      errors.push_back(std::move(*err));
    }
  }

  return errors;
}

} // namespace tsanalyzer

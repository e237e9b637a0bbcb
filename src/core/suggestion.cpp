/**
 * @file suggestion.cpp
 * @brief Per-category suggestion handlers
 *
 * Message indices below refer to the parts of the message split on '\'';
 * odd parts are the quoted values of the compiler's message template.
 */

#include "core/suggestion.hpp"
#include "core/message_extract.hpp"

#include "fmt/color.h"
#include "fmt/core.h"
#include "fmt/format.h"

namespace tsanalyzer {

namespace {

const auto BAD_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
const auto GOOD_STYLE = fmt::fg(fmt::color::green) | fmt::emphasis::bold;
const auto WARN_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
const auto SUBJECT_STYLE =
    fmt::fg(fmt::color::red) | fmt::emphasis::bold | fmt::emphasis::italic;

// Applies a text style to extracted names when colors are enabled
class styler {
public:
  explicit styler(const synthesis_options &options) : m_options(options) {}

  std::string operator()(const std::string &text,
                         const fmt::text_style &style) const {
    if (!m_options.colorize) {
      return text;
    }
    return fmt::format(style, "{}", text);
  }

private:
  const synthesis_options &m_options;
};

using suggestion_handler = std::optional<suggestion> (*)(
    const ts_error &, const std::vector<token> &, const styler &);

std::optional<suggestion> make_suggestion(std::vector<std::string> lines,
                                          std::string help) {
  suggestion result;
  result.suggestions = std::move(lines);
  result.help = std::move(help);
  return result;
}

// TS2322
std::optional<suggestion> handle_type_mismatch(const ts_error &err,
                                               const std::vector<token> &,
                                               const styler &style) {
  std::string line;
  if (auto types = parse_assignment_types(err.message)) {
    line = fmt::format("Try converting this value from `{}` to `{}`.",
                       style(types->first, BAD_STYLE),
                       style(types->second, GOOD_STYLE));
  } else {
    line = "Try converting this value to the expected type.";
  }

  return make_suggestion(
      {line},
      "Ensure that the types are compatible or perform an explicit conversion.");
}

// TS2345
std::optional<suggestion> handle_inline_type_mismatch(const ts_error &err,
                                                      const std::vector<token> &,
                                                      const styler &style) {
  std::vector<std::string> lines;
  if (auto mismatches = diff_argument_object_types(err.message)) {
    for (const auto &mismatch : *mismatches) {
      lines.push_back(
          fmt::format("Property `{}` is provided as `{}` but expects `{}`.",
                      style(mismatch.property, BAD_STYLE),
                      style(mismatch.provided, BAD_STYLE),
                      style(mismatch.expected, GOOD_STYLE)));
    }
  }

  return make_suggestion(std::move(lines),
                         "Check the function arguments to ensure they match "
                         "the expected parameter types.");
}

// TS2554
std::optional<suggestion> handle_missing_parameters(const ts_error &err,
                                                    const std::vector<token> &tokens,
                                                    const styler &style) {
  std::string fn_name = quoted_part(err.message, 1, "function");
  if (const token *tok = find_token_at(tokens, err.line, err.column)) {
    fn_name = tok->raw;
  }

  return make_suggestion(
      {fmt::format(
          "Check if all required arguments are provided when invoking {}",
          style(fn_name, BAD_STYLE))},
      fmt::format("Function `{}` is missing 1 or more arguments.",
                  style(fn_name, BAD_STYLE)));
}

// TS7006, TS7044
std::optional<suggestion> handle_no_implicit_any(const ts_error &err,
                                                 const std::vector<token> &,
                                                 const styler &style) {
  std::string param_name = quoted_part(err.message, 1, "parameter");

  return make_suggestion(
      {fmt::format("{} is implicitly `any`.", style(param_name, BAD_STYLE))},
      "Consider adding type annotations to avoid implicit 'any' types.");
}

// TS2741
std::optional<suggestion> handle_property_missing_in_type(const ts_error &err,
                                                          const std::vector<token> &tokens,
                                                          const styler &style) {
  auto type_name = parse_missing_property_type(err.message);
  if (!type_name) {
    return make_suggestion({"Verify that the object structure includes all "
                            "required members of the specified type."},
                           "Ensure the object has all required properties "
                           "defined in the type.");
  }

  std::string var_name = "object";
  if (const token *tok = find_token_at(tokens, err.line, err.column)) {
    var_name = tok->raw;
  }

  return make_suggestion(
      {fmt::format("Verify that `{}` matches the annotated type `{}`.",
                   style(var_name, SUBJECT_STYLE),
                   style(*type_name, BAD_STYLE))},
      fmt::format("Ensure that `{}` has all required properties defined in "
                  "the type `{}`.",
                  style(var_name, SUBJECT_STYLE), style(*type_name, BAD_STYLE)));
}

// TS2367
std::optional<suggestion> handle_unintentional_comparison(const ts_error &,
                                                          const std::vector<token> &,
                                                          const styler &) {
  return make_suggestion(
      {"Impossible to compare as left side value is narrowed to a single "
       "value."},
      "Review the comparison logic to ensure it makes sense.");
}

// TS2339
std::optional<suggestion> handle_property_does_not_exist(const ts_error &err,
                                                         const std::vector<token> &,
                                                         const styler &style) {
  std::string property_name = quoted_part(err.message, 1, "property");
  std::string type_name = quoted_part(err.message, 3, "type");

  return make_suggestion(
      {fmt::format("Property `{}` is not found on type `{}`.",
                   style(property_name, BAD_STYLE),
                   style(type_name, BAD_STYLE))},
      "Ensure the property exists on the type or adjust your code to avoid "
      "accessing it.");
}

// TS2532, TS18048
std::optional<suggestion> handle_object_possibly_undefined(const ts_error &err,
                                                           const std::vector<token> &tokens,
                                                           const styler &style) {
  std::string var_name = quoted_part(err.message, 1, "object");

  // "Object is possibly 'undefined'." does not name the object
  if (err.message.rfind("Object is possibly", 0) == 0) {
    var_name = "object";
    if (const token *tok = find_token_at(tokens, err.line, err.column)) {
      var_name = tok->raw;
    }
  }

  return make_suggestion(
      {fmt::format("{} may be `undefined` here.", style(var_name, BAD_STYLE))},
      fmt::format("Consider optional chaining or an explicit check before "
                  "attempting to access `{}`",
                  style(var_name, BAD_STYLE)));
}

// TS2352
std::optional<suggestion> handle_direct_cast(const ts_error &err,
                                             const std::vector<token> &,
                                             const styler &style) {
  std::string from = quoted_part(err.message, 1, "type");
  std::string to = quoted_part(err.message, 3, "type");

  return make_suggestion(
      {fmt::format("Directly casting from `{}` to `{}` can be unsafe or "
                   "mistaken, as both types do not overlap sufficiently.",
                   style(from, WARN_STYLE), style(to, WARN_STYLE))},
      fmt::format("Consider using type guards or intermediate conversions to "
                  "ensure type safety when casting from `{}` to `{}`, only "
                  "intermediately cast `as unknown` if this is desired.",
                  style(from, WARN_STYLE), style(to, WARN_STYLE)));
}

// TS2556
std::optional<suggestion> handle_spread_argument(const ts_error &,
                                                 const std::vector<token> &,
                                                 const styler &) {
  return make_suggestion(
      {"The argument being spread must be a tuple type or a `spreadable` "
       "type."},
      "Ensure that the argument being spread is a tuple type compatible with "
      "the function's parameter type.");
}

// TS2363
std::optional<suggestion> handle_right_side_arithmetic(const ts_error &,
                                                       const std::vector<token> &,
                                                       const styler &) {
  return make_suggestion(
      {"The right-hand side of any arithmetic operation must be a number or "
       "enumerable."},
      "Ensure that the value on the right side of the arithmetic operator is "
      "of type `number`, `bigint` or an enum member.");
}

// TS2362
std::optional<suggestion> handle_left_side_arithmetic(const ts_error &,
                                                      const std::vector<token> &,
                                                      const styler &) {
  return make_suggestion(
      {"The left-hand side of any arithmetic operation must be a number or "
       "enumerable."},
      "Ensure that the value on the left side of the arithmetic operator is "
      "of type `number`, `bigint` or an enum member.");
}

// TS2394
std::optional<suggestion> handle_incompatible_overload(const ts_error &,
                                                       const std::vector<token> &,
                                                       const styler &) {
  return make_suggestion(
      {"The provided arguments do not match any overload of the function."},
      "Check the function overloads and ensure that this signature adheres "
      "to the parent signature.");
}

// TS2451
std::optional<suggestion> handle_invalid_shadow(const ts_error &err,
                                                const std::vector<token> &,
                                                const styler &style) {
  std::string var_name = quoted_part(err.message, 1, "variable");

  return make_suggestion(
      {fmt::format("Declared variable `{}` can not shadow another variable "
                   "in this scope.",
                   style(var_name, BAD_STYLE))},
      fmt::format("Consider renaming the invalid shadowed variable `{}`.",
                  style(var_name, BAD_STYLE)));
}

// TS2307
std::optional<suggestion> handle_missing_module(const ts_error &err,
                                                const std::vector<token> &,
                                                const styler &style) {
  std::string module_name = quoted_part(err.message, 1, "module");

  return make_suggestion(
      {fmt::format("Module `{}` does not exist.", style(module_name, BAD_STYLE))},
      fmt::format("Ensure that the module `{}` is installed and the import "
                  "path is correct.",
                  style(module_name, BAD_STYLE)));
}

// TS2540
std::optional<suggestion> handle_readonly_assignment(const ts_error &err,
                                                     const std::vector<token> &,
                                                     const styler &style) {
  std::string property_name = quoted_part(err.message, 1, "property");

  return make_suggestion(
      {fmt::format("Property `{}` is readonly and thus can not be re-assigned.",
                   style(property_name, BAD_STYLE))},
      fmt::format("Consider removing the assignment to the read-only property "
                  "`{}` or changing its declaration to be mutable.",
                  style(property_name, BAD_STYLE)));
}

// TS2420
std::optional<suggestion> handle_interface_implementation(const ts_error &err,
                                                          const std::vector<token> &,
                                                          const styler &style) {
  std::string class_name = quoted_part(err.message, 1, "class");
  std::string interface_name = quoted_part(err.message, 3, "interface");
  std::string missing_property = quoted_part(err.message, 5, "property");

  return make_suggestion(
      {fmt::format("Class `{}` does not implement `{}` from interface `{}`.",
                   style(class_name, BAD_STYLE),
                   style(missing_property, BAD_STYLE),
                   style(interface_name, BAD_STYLE))},
      fmt::format("Ensure that `{}` provides all required properties and "
                  "methods defined in the interface `{}`.",
                  style(class_name, BAD_STYLE),
                  style(interface_name, BAD_STYLE)));
}

// TS2416
std::optional<suggestion> handle_property_not_assignable_to_base(const ts_error &err,
                                                                 const std::vector<token> &,
                                                                 const styler &style) {
  std::string property = quoted_part(err.message, 1, "property");
  std::string impl_type = quoted_part(err.message, 3, "type");
  std::string base_type = quoted_part(err.message, 5, "base type");
  std::string property_impl_type = quoted_part(err.message, 7, "type");
  std::string property_base_type = quoted_part(err.message, 9, "base type");

  return make_suggestion(
      {fmt::format("Property `{}` in class `{}` is not assignable to the same "
                   "property in base class `{}`.",
                   style(property, BAD_STYLE), style(impl_type, BAD_STYLE),
                   style(base_type, BAD_STYLE)),
       fmt::format("Property `{}` is implemented as type `{}` but defined as "
                   "`{}`.",
                   style(property, BAD_STYLE),
                   style(property_impl_type, BAD_STYLE),
                   style(property_base_type, GOOD_STYLE))},
      fmt::format("Ensure that the type of property `{}` in class `{}` is "
                  "compatible with the type defined in base class `{}`.",
                  style(property, BAD_STYLE), style(impl_type, BAD_STYLE),
                  style(base_type, BAD_STYLE)));
}

// TS2304
std::optional<suggestion> handle_cannot_find_identifier(const ts_error &err,
                                                        const std::vector<token> &,
                                                        const styler &style) {
  std::string identifier = quoted_part(err.message, 1, "identifier");

  return make_suggestion(
      {fmt::format("Identifier `{}` cannot be found in the current scope.",
                   style(identifier, BAD_STYLE))},
      fmt::format("Ensure that `{}` is declared and accessible in the current "
                  "scope or remove this reference.",
                  style(identifier, BAD_STYLE)));
}

// TS2355
std::optional<suggestion> handle_missing_return_value(const ts_error &,
                                                      const std::vector<token> &,
                                                      const styler &) {
  return make_suggestion(
      {"A return value is missing where one is expected."},
      "A function that declares a return type must return a value of that "
      "type on all branches.");
}

// TS2349
std::optional<suggestion> handle_uncallable_expression(const ts_error &err,
                                                       const std::vector<token> &,
                                                       const styler &style) {
  std::string expr = quoted_part(err.message, 1, "expression");

  return make_suggestion(
      {fmt::format("Expression `{}` can not be invoked or called.",
                   style(expr, BAD_STYLE))},
      fmt::format("Ensure that `{}` is a function or has a callable signature "
                  "before invoking it.",
                  style(expr, BAD_STYLE)));
}

// TS2538
std::optional<suggestion> handle_invalid_index_type(const ts_error &err,
                                                    const std::vector<token> &,
                                                    const styler &style) {
  std::string index_type = quoted_part(err.message, 1, "type");

  return make_suggestion(
      {fmt::format("`{}` cannot be used as an index accessor.",
                   style(index_type, BAD_STYLE))},
      "Ensure that the index type is `number`, `string`, `symbol` or a "
      "compatible index type.");
}

// TS2551
std::optional<suggestion> handle_typo_property(const ts_error &err,
                                               const std::vector<token> &,
                                               const styler &style) {
  std::string property_name = quoted_part(err.message, 1, "property");
  std::string type_name = quoted_part(err.message, 3, "type");
  std::string suggested_name = quoted_part(err.message, 5, "property");

  return make_suggestion(
      {fmt::format("Property `{}` does not exist on type `{}`. Try `{}` "
                   "instead",
                   style(property_name, BAD_STYLE),
                   style(type_name, WARN_STYLE),
                   style(suggested_name, GOOD_STYLE))},
      fmt::format("Check for typos in the property name `{}` or ensure that "
                  "it is defined on type `{}`.",
                  style(property_name, BAD_STYLE), style(type_name, BAD_STYLE)));
}

suggestion_handler select_handler(error_kind kind) {
  switch (kind) {
  case error_kind::TYPE_MISMATCH:
    return handle_type_mismatch;
  case error_kind::INLINE_TYPE_MISMATCH:
    return handle_inline_type_mismatch;
  case error_kind::MISSING_PARAMETERS:
    return handle_missing_parameters;
  case error_kind::NO_IMPLICIT_ANY:
    return handle_no_implicit_any;
  case error_kind::PROPERTY_MISSING_IN_TYPE:
    return handle_property_missing_in_type;
  case error_kind::UNINTENTIONAL_COMPARISON:
    return handle_unintentional_comparison;
  case error_kind::PROPERTY_DOES_NOT_EXIST:
    return handle_property_does_not_exist;
  case error_kind::OBJECT_POSSIBLY_UNDEFINED:
    return handle_object_possibly_undefined;
  case error_kind::DIRECT_CAST_POTENTIALLY_MISTAKEN:
    return handle_direct_cast;
  case error_kind::SPREAD_ARGUMENT_MUST_BE_TUPLE:
    return handle_spread_argument;
  case error_kind::RIGHT_SIDE_ARITHMETIC_MUST_BE_NUMBER:
    return handle_right_side_arithmetic;
  case error_kind::LEFT_SIDE_ARITHMETIC_MUST_BE_NUMBER:
    return handle_left_side_arithmetic;
  case error_kind::INCOMPATIBLE_OVERLOAD:
    return handle_incompatible_overload;
  case error_kind::INVALID_SHADOW_IN_SCOPE:
    return handle_invalid_shadow;
  case error_kind::NON_EXISTENT_MODULE_IMPORT:
    return handle_missing_module;
  case error_kind::READONLY_PROPERTY_ASSIGNMENT:
    return handle_readonly_assignment;
  case error_kind::INCORRECT_INTERFACE_IMPLEMENTATION:
    return handle_interface_implementation;
  case error_kind::PROPERTY_NOT_ASSIGNABLE_TO_BASE:
    return handle_property_not_assignable_to_base;
  case error_kind::CANNOT_FIND_IDENTIFIER:
    return handle_cannot_find_identifier;
  case error_kind::MISSING_RETURN_VALUE:
    return handle_missing_return_value;
  case error_kind::UNCALLABLE_EXPRESSION:
    return handle_uncallable_expression;
  case error_kind::INVALID_INDEX_TYPE:
    return handle_invalid_index_type;
  case error_kind::TYPO_PROPERTY_ON_TYPE:
    return handle_typo_property;
  // No reliable extraction for these yet; a handler can be added here
  // once their message templates are pinned down.
  case error_kind::OBJECT_POSSIBLY_NULL:
  case error_kind::OBJECT_IS_UNKNOWN:
  case error_kind::UNSUPPORTED:
    return nullptr;
  }
  return nullptr;
}

} // namespace

bool has_suggestion_handler(error_kind kind) {
  return select_handler(kind) != nullptr;
}

std::optional<suggestion> synthesize_suggestion(const ts_error &err,
                                                const std::vector<token> &tokens,
                                                const synthesis_options &options) {
  suggestion_handler handler = select_handler(err.code.kind);
  if (!handler) {
    return std::nullopt;
  }

  styler style(options);
  return handler(err, tokens, style);
}

} // namespace tsanalyzer

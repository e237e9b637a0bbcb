/**
 * @file tokenizer.hpp
 * @brief Minimal TypeScript tokenizer feeding the suggestion engine
 *
 * Only token spans matter here: the engine looks up the token under an
 * error position to name the subject of a diagnostic.
 */

#pragma once

#include "core/types.h"

#include <string>
#include <vector>

namespace tsanalyzer {

/**
 * @brief A lexical unit with its source position
 *
 * line is 1-based like diagnostic lines. column is 0-based and counted in
 * characters, i.e. the diagnostic column minus one.
 */
struct token {
  std::string raw;
  tsanalyzer_uint_t line = 0;
  tsanalyzer_uint_t column = 0;
};

/**
 * @brief Number of UTF-8 code points in text
 */
tsanalyzer_size_t utf8_length(const std::string &text);

/**
 * @brief Split TypeScript source into tokens
 *
 * Produces identifiers, numbers, string/template literals and single
 * punctuation characters. Whitespace and comments are skipped. Unterminated
 * literals and comments run to the end of the input.
 *
 * @param source Source text
 * @return Tokens in source order
 */
std::vector<token> tokenize(const std::string &source);

/**
 * @brief Read and tokenize a source file
 *
 * @param file_path Path to the file
 * @return Tokens, or an empty vector if the file cannot be read
 */
std::vector<token> tokenize_file(const std::string &file_path);

} // namespace tsanalyzer

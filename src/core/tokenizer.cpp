/**
 * @file tokenizer.cpp
 * @brief Implementation of the TypeScript tokenizer
 */

#include "core/tokenizer.hpp"

#include <fstream>
#include <sstream>

namespace tsanalyzer {

namespace {

bool is_continuation_byte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

bool is_identifier_start(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
         c == '$' || static_cast<unsigned char>(c) >= 0x80;
}

bool is_identifier_continue(char c) {
  return is_identifier_start(c) || (c >= '0' && c <= '9');
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

class scanner {
public:
  explicit scanner(const std::string &source) : m_source(source) {}

  std::vector<token> run() {
    std::vector<token> tokens;

    while (!is_at_end()) {
      char c = peek();

      if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
        advance();
        continue;
      }

      if (c == '/' && peek_next() == '/') {
        while (!is_at_end() && peek() != '\n') {
          advance();
        }
        continue;
      }

      if (c == '/' && peek_next() == '*') {
        advance();
        advance();
        while (!is_at_end() && !(peek() == '*' && peek_next() == '/')) {
          advance();
        }
        if (!is_at_end()) {
          advance();
          advance();
        }
        continue;
      }

      begin_token();

      if (is_identifier_start(c)) {
        while (!is_at_end() && is_identifier_continue(peek())) {
          advance();
        }
      } else if (is_digit(c)) {
        while (!is_at_end() &&
               (is_identifier_continue(peek()) || peek() == '.')) {
          advance();
        }
      } else if (c == '"' || c == '\'' || c == '`') {
        lex_string(c);
      } else {
        advance();
      }

      tokens.push_back(make_token());
    }

    return tokens;
  }

private:
  const std::string &m_source;
  tsanalyzer_size_t m_pos = 0;
  tsanalyzer_uint_t m_line = 1;
  tsanalyzer_uint_t m_column = 0;

  tsanalyzer_size_t m_start = 0;
  tsanalyzer_uint_t m_start_line = 1;
  tsanalyzer_uint_t m_start_column = 0;

  bool is_at_end() const { return m_pos >= m_source.size(); }

  char peek() const { return is_at_end() ? '\0' : m_source[m_pos]; }

  char peek_next() const {
    return m_pos + 1 < m_source.size() ? m_source[m_pos + 1] : '\0';
  }

  // Advance one byte; line/column follow code points
  void advance() {
    char c = m_source[m_pos++];
    if (c == '\n') {
      ++m_line;
      m_column = 0;
    } else if (!is_continuation_byte(c)) {
      ++m_column;
    }
  }

  void begin_token() {
    m_start = m_pos;
    m_start_line = m_line;
    m_start_column = m_column;
  }

  void lex_string(char quote) {
    advance(); // opening quote
    while (!is_at_end() && peek() != quote) {
      if (peek() == '\\') {
        advance();
        if (is_at_end()) {
          break;
        }
      } else if (peek() == '\n' && quote != '`') {
        // Unterminated single-line literal
        return;
      }
      advance();
    }
    if (!is_at_end()) {
      advance(); // closing quote
    }
  }

  token make_token() const {
    token tok;
    tok.raw = m_source.substr(m_start, m_pos - m_start);
    tok.line = m_start_line;
    tok.column = m_start_column;
    return tok;
  }
};

} // namespace

tsanalyzer_size_t utf8_length(const std::string &text) {
  tsanalyzer_size_t count = 0;
  for (char c : text) {
    if (!is_continuation_byte(c)) {
      ++count;
    }
  }
  return count;
}

std::vector<token> tokenize(const std::string &source) {
  scanner scan(source);
  return scan.run();
}

std::vector<token> tokenize_file(const std::string &file_path) {
  std::ifstream file(file_path, std::ios::binary);
  if (!file.is_open()) {
    return {};
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return tokenize(buffer.str());
}

} // namespace tsanalyzer

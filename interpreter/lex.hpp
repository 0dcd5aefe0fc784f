// Nyunda lexer.
// `tokenize` turns source text into `Token`s, always terminated by one `eof` token.

#pragma once
#include "diag.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace lex {

enum class Token_kind {
  keyword,
  identifier,
  number,
  string,
  op,
  symbol,
  eof,
};

std::string_view kind_name(Token_kind);

// Sundanese keywords, in the order of their English meaning:
// if, else-if, else, while, print, not, true, false, and, or
namespace kw {
constexpr std::string_view if_ = "upami";
constexpr std::string_view elif = "lamun";
constexpr std::string_view else_ = "sanes";
constexpr std::string_view while_ = "bari";
constexpr std::string_view print = "cetak";
constexpr std::string_view not_ = "henteu";
constexpr std::string_view true_ = "leres";
constexpr std::string_view false_ = "palsu";
constexpr std::string_view and_ = "jeung";
constexpr std::string_view or_ = "atawa";
} // namespace kw

bool is_keyword(std::string_view);

struct Token {
  Token_kind kind;
  std::string text; // The lexeme exactly as written
  Source_location location;

  bool is(Token_kind k) const { return kind == k; }
  bool is(Token_kind k, std::string_view t) const { return kind == k && text == t; }
};

std::vector<Token> tokenize(std::string_view source);

} // namespace lex

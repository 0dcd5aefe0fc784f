#include "lex.hpp"
#include "util.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <optional>

namespace lex {

std::string_view kind_name(Token_kind kind) {
  switch (kind) {
  case Token_kind::keyword: return "keyword";
  case Token_kind::identifier: return "identifier";
  case Token_kind::number: return "number";
  case Token_kind::string: return "string";
  case Token_kind::op: return "operator";
  case Token_kind::symbol: return "symbol";
  case Token_kind::eof: return "end of input";
  }
  util::unreachable();
}

namespace {

constexpr std::array keywords = {
  kw::if_, kw::elif, kw::else_, kw::while_, kw::print,
  kw::not_, kw::true_, kw::false_, kw::and_, kw::or_,
};

// Multichar operators must come before their single-char prefixes
constexpr std::array<std::string_view, 13> operators = {
  "**", "==", "!=", "<=", ">=",
  "=", "+", "-", "*", "/", "%", "<", ">",
};

constexpr std::string_view symbols = "(){};";

bool is_word_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_digit(char c) {
  return std::isdigit(static_cast<unsigned char>(c));
}

class Lexer {
  std::string_view src;
  Source_location location;

  std::optional<char> peek(int ahead = 0) const {
    size_t at = size_t(location.offset) + ahead;
    if (at >= src.size())
      return std::nullopt;
    return src[at];
  }

  // Advances past one character the caller has already seen via peek()
  void consume_expect([[maybe_unused]] char expected) {
    assert(peek() == expected);
    if (expected == '\n')
      location = location.next_line();
    else
      location = location.next_column();
  }

  std::string_view lexeme_since(Source_location start) const {
    return src.substr(start.offset, location.offset - start.offset);
  }

  std::optional<char> peek_after_whitespace() {
    bool inside_comment = false;
    while (auto c = peek()) {
      if (*c == '#')
        inside_comment = true;
      else if (*c == '\n')
        inside_comment = false;
      if (!std::isspace(static_cast<unsigned char>(*c)) && !inside_comment)
        return c;
      consume_expect(*c);
    }
    return std::nullopt;
  }

  Token make(Token_kind kind, Source_location start) const {
    return { kind, std::string(lexeme_since(start)), start };
  }

  // \d+(\.\d+)?
  Token consume_number() {
    auto start = location;
    while (auto c = peek()) {
      if (!is_digit(*c))
        break;
      consume_expect(*c);
    }
    if (peek() == '.' && peek(1) && is_digit(*peek(1))) {
      consume_expect('.');
      while (auto c = peek()) {
        if (!is_digit(*c))
          break;
        consume_expect(*c);
      }
    }
    return make(Token_kind::number, start);
  }

  Token consume_word() {
    auto start = location;
    while (auto c = peek()) {
      if (!is_word_char(*c))
        break;
      consume_expect(*c);
    }
    auto kind = is_keyword(lexeme_since(start)) ? Token_kind::keyword : Token_kind::identifier;
    return make(kind, start);
  }

  // The token text keeps the quotes, so that it spells the source exactly
  Token consume_string_literal() {
    auto start = location;
    consume_expect('"');
    while (auto c = peek()) {
      if (*c == '\n')
        break;
      consume_expect(*c);
      if (*c == '"')
        return make(Token_kind::string, start);
    }
    throw diag::Lex_error(start, '"', "Unterminated string literal starting with");
  }

  std::optional<Token> try_consume_operator() {
    auto rest = src.substr(location.offset);
    for (std::string_view op: operators) {
      if (rest.substr(0, op.size()) != op)
        continue;
      auto start = location;
      for (char c: op)
        consume_expect(c);
      return make(Token_kind::op, start);
    }
    return std::nullopt;
  }

public:
  explicit Lexer(std::string_view src_): src(src_) {}

  Token consume_token() {
    auto peeked = peek_after_whitespace();
    if (!peeked)
      return { Token_kind::eof, "", location };

    char c = *peeked;
    if (is_digit(c))
      return consume_number();
    if (c == '"')
      return consume_string_literal();
    if (is_word_start(c))
      return consume_word();
    if (auto op = try_consume_operator())
      return std::move(*op);
    if (symbols.find(c) != std::string_view::npos) {
      auto start = location;
      consume_expect(c);
      return make(Token_kind::symbol, start);
    }
    throw diag::Lex_error(location, c, "Invalid character");
  }
};

} // anon namespace

bool is_keyword(std::string_view word) {
  return std::find(keywords.begin(), keywords.end(), word) != keywords.end();
}

std::vector<Token> tokenize(std::string_view source) {
  std::vector<Token> tokens;
  Lexer lexer(source);
  do {
    tokens.push_back(lexer.consume_token());
  } while (!tokens.back().is(Token_kind::eof));
  return tokens;
}

} // namespace lex

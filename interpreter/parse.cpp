#include "parse.hpp"
#include <algorithm>
#include <charconv>
#include <initializer_list>

namespace {

using lex::Token;
using lex::Token_kind;
namespace kw = lex::kw;

std::string describe(const Token& token) {
  if (token.is(Token_kind::eof))
    return std::string(lex::kind_name(token.kind));
  return fmt::format("{} '{}'", lex::kind_name(token.kind), token.text);
}

class Parser {
  const std::vector<Token>& tokens;
  size_t pos = 0;

  const Token& peek() const { return tokens[pos]; }

  // Never moves past the trailing `eof`
  const Token& consume() {
    const Token& token = tokens[pos];
    if (!token.is(Token_kind::eof))
      pos++;
    return token;
  }

  bool at(Token_kind kind, std::string_view text) const { return peek().is(kind, text); }
  bool at_op(std::string_view text) const { return at(Token_kind::op, text); }
  bool at_symbol(std::string_view text) const { return at(Token_kind::symbol, text); }
  bool at_keyword(std::string_view text) const { return at(Token_kind::keyword, text); }

  [[noreturn]] void fail(std::string expected) const {
    throw diag::Parse_error(peek().location, std::move(expected), describe(peek()));
  }

  const Token& expect(Token_kind kind, std::string_view text) {
    if (!at(kind, text))
      fail(fmt::format("'{}'", text));
    return consume();
  }

  const Token& expect(Token_kind kind) {
    if (!peek().is(kind))
      fail(std::string(lex::kind_name(kind)));
    return consume();
  }

  void skip_separators() {
    while (at_symbol(";"))
      consume();
  }

  // =========================================================================
  // Statements

  ast::Block block() {
    expect(Token_kind::symbol, "{");
    ast::Block statements;
    for (skip_separators(); !at_symbol("}"); skip_separators()) {
      if (peek().is(Token_kind::eof))
        fail("'}'");
      statements.push_back(statement());
    }
    consume();
    return statements;
  }

  ast::Node statement() {
    if (at_keyword(kw::if_))
      return conditional();
    if (at_keyword(kw::while_))
      return loop();
    if (at_keyword(kw::print))
      return print();
    if (peek().is(Token_kind::identifier))
      return assignment();
    fail("statement");
  }

  ast::Node assignment() {
    const Token& name = expect(Token_kind::identifier);
    expect(Token_kind::op, "=");
    auto value = expression();
    return ast::Node(ast::Assignment{ name.text, std::move(value) }, name.location);
  }

  // Handles both `upami` and the `lamun` links of an else-if chain;
  // a `lamun` becomes an `If` nested alone inside the previous else branch.
  ast::Node conditional() {
    const Token& keyword = consume();
    auto condition = expression();
    auto then_branch = block();

    ast::Block else_branch;
    if (at_keyword(kw::elif)) {
      else_branch.push_back(conditional());
    } else if (at_keyword(kw::else_)) {
      consume();
      else_branch = block();
    }

    return ast::Node(
      ast::If{ std::move(condition), std::move(then_branch), std::move(else_branch) },
      keyword.location
    );
  }

  ast::Node loop() {
    const Token& keyword = consume();
    auto condition = expression();
    auto body = block();
    return ast::Node(ast::While{ std::move(condition), std::move(body) }, keyword.location);
  }

  ast::Node print() {
    const Token& keyword = consume();
    expect(Token_kind::symbol, "(");
    auto argument = expression();
    expect(Token_kind::symbol, ")");
    return ast::Node(ast::Print{ std::move(argument) }, keyword.location);
  }

  // =========================================================================
  // Expressions, from the lowest precedence to the highest

  ast::Node expression() { return comparison(); }

  // Left-associative level of binary operators, each operand parsed by `next`
  template<typename Next>
  ast::Node binary_level(Next next, std::initializer_list<ast::Binary_op> ops) {
    ast::Node lhs = (this->*next)();
    while (peek().is(Token_kind::op)) {
      auto op = ast::binary_op_from_symbol(peek().text);
      if (!op || std::find(ops.begin(), ops.end(), *op) == ops.end())
        break;
      auto loc = consume().location;
      ast::Node rhs = (this->*next)();
      lhs = ast::binary(*op, std::move(lhs), std::move(rhs), loc);
    }
    return lhs;
  }

  ast::Node comparison() {
    using enum ast::Binary_op;
    return binary_level(&Parser::additive, { equ, neq, gt, lt, geq, leq });
  }

  ast::Node additive() {
    using enum ast::Binary_op;
    return binary_level(&Parser::multiplicative, { add, sub });
  }

  ast::Node multiplicative() {
    using enum ast::Binary_op;
    return binary_level(&Parser::exponent, { mul, div, mod });
  }

  // Right-associative: 2 ** 3 ** 2 is 2 ** (3 ** 2)
  ast::Node exponent() {
    auto base = unary();
    if (!at_op("**"))
      return base;
    auto loc = consume().location;
    auto power = exponent();
    return ast::binary(ast::Binary_op::pow, std::move(base), std::move(power), loc);
  }

  ast::Node unary() {
    std::optional<ast::Unary_op> op;
    if (at_op("-"))
      op = ast::Unary_op::neg;
    else if (at_keyword(kw::not_))
      op = ast::Unary_op::logical_not;
    if (!op)
      return primary();

    auto loc = consume().location;
    return ast::unary(*op, unary(), loc);
  }

  ast::Node primary() {
    const Token& token = peek();
    switch (token.kind) {
    case Token_kind::number: {
      double value;
      auto [ptr, ec] = std::from_chars(token.text.data(), token.text.data() + token.text.size(), value);
      if (ec != std::errc{})
        fail("number literal that fits a double");
      consume();
      return ast::number(value, token.location);
    }
    case Token_kind::string:
      consume();
      return ast::Node(ast::String{ token.text.substr(1, token.text.size() - 2) }, token.location);
    case Token_kind::identifier:
      consume();
      return ast::identifier(token.text, token.location);
    case Token_kind::keyword:
      if (token.text == kw::true_ || token.text == kw::false_) {
        consume();
        return ast::number(token.text == kw::true_ ? 1 : 0, token.location);
      }
      break;
    case Token_kind::symbol:
      if (token.text == "(") {
        consume();
        auto inner = expression();
        expect(Token_kind::symbol, ")");
        return inner;
      }
      break;
    default:
      break;
    }
    fail("expression");
  }

public:
  explicit Parser(const std::vector<Token>& tokens_): tokens(tokens_) {}

  ast::Program program() {
    ast::Program result;
    for (skip_separators(); !peek().is(Token_kind::eof); skip_separators())
      result.statements.push_back(statement());
    return result;
  }
};

} // anon namespace

namespace parse {

ast::Program parse(const std::vector<lex::Token>& tokens) {
  if (tokens.empty() || !tokens.back().is(Token_kind::eof)) {
    Source_location loc = tokens.empty() ? Source_location{} : tokens.back().location;
    throw diag::Parse_error(loc, "end of input", "a token stream without it");
  }
  return Parser(tokens).program();
}

ast::Program parse_source(std::string_view source) {
  return parse(lex::tokenize(source));
}

} // namespace parse

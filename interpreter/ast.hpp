#pragma once
#include "diag.hpp"
#include "util.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ast {

struct Node; // fwd declare for Box and Block

enum class Binary_op {
  add, sub, mul, div, mod, pow,
  equ, neq, gt, lt, geq, leq,
};

enum class Unary_op { neg, logical_not };

std::string_view op_symbol(Binary_op);
std::string_view op_symbol(Unary_op);
std::optional<Binary_op> binary_op_from_symbol(std::string_view);
bool is_comparison(Binary_op);

using Block = std::vector<Node>;

// Expressions
struct Number { double value; };
struct String { std::string value; };
struct Identifier { std::string name; };
struct Binary { Binary_op op; util::Box<Node> lhs; util::Box<Node> rhs; };
struct Unary { Unary_op op; util::Box<Node> operand; };

// Statements
struct Assignment { std::string name; util::Box<Node> value; };
struct If { util::Box<Node> condition; Block then_branch; Block else_branch; };
struct While { util::Box<Node> condition; Block body; };
struct Print { util::Box<Node> argument; };

using Any_node = util::Variant<
  Number,
  String,
  Identifier,
  Binary,
  Unary,
  Assignment,
  If,
  While,
  Print
>;

struct Node: Any_node {
  Source_location location;

  Node(Any_node base, Source_location loc = {}):
    Any_node(std::move(base)), location(loc) {}

  bool is_expression() const {
    return is<Number>() || is<String>() || is<Identifier>() || is<Binary>() || is<Unary>();
  }
};

struct Program {
  Block statements;
};

// Shorthands for building trees by hand
Node number(double, Source_location = {});
Node identifier(std::string, Source_location = {});
Node binary(Binary_op, Node lhs, Node rhs, Source_location = {});
Node unary(Unary_op, Node operand, Source_location = {});

// Canonical text of a tree, ignoring locations. Two trees are structurally
// identical exactly when their signatures are equal.
std::string signature(const Node&);
std::string signature(const Program&);

// Names of the identifiers that occur in an expression, sorted, without duplicates
std::vector<std::string> free_variables(const Node&);

} // namespace ast

// Prints trees back as Nyunda source. Every binary and unary expression is
// parenthesized, so the output re-parses into the same tree.
template<>
struct fmt::formatter<ast::Node> {
  constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
  appender format(const ast::Node&, format_context& ctx) const;
};

template<>
struct fmt::formatter<ast::Program> {
  constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
  appender format(const ast::Program&, format_context& ctx) const;
};

#include "ast.hpp"
#include <algorithm>
#include <array>
#include <utility>

namespace ast {

namespace {

constexpr std::array<std::pair<Binary_op, std::string_view>, 12> binary_symbols = {{
  { Binary_op::add, "+" },
  { Binary_op::sub, "-" },
  { Binary_op::mul, "*" },
  { Binary_op::div, "/" },
  { Binary_op::mod, "%" },
  { Binary_op::pow, "**" },
  { Binary_op::equ, "==" },
  { Binary_op::neq, "!=" },
  { Binary_op::gt, ">" },
  { Binary_op::lt, "<" },
  { Binary_op::geq, ">=" },
  { Binary_op::leq, "<=" },
}};

void collect_identifiers(const Node& node, std::vector<std::string>& out) {
  node.match(
    [&] (const Identifier& id) { out.push_back(id.name); },
    [&] (const Binary& bin) {
      collect_identifiers(*bin.lhs, out);
      collect_identifiers(*bin.rhs, out);
    },
    [&] (const Unary& un) { collect_identifiers(*un.operand, out); },
    [&] (const auto&) {}
  );
}

} // anon namespace

std::string_view op_symbol(Binary_op op) {
  for (auto [candidate, symbol]: binary_symbols) {
    if (candidate == op)
      return symbol;
  }
  util::unreachable();
}

std::string_view op_symbol(Unary_op op) {
  switch (op) {
  case Unary_op::neg: return "-";
  case Unary_op::logical_not: return "henteu";
  }
  util::unreachable();
}

std::optional<Binary_op> binary_op_from_symbol(std::string_view text) {
  for (auto [op, symbol]: binary_symbols) {
    if (symbol == text)
      return op;
  }
  return std::nullopt;
}

bool is_comparison(Binary_op op) {
  switch (op) {
  case Binary_op::equ:
  case Binary_op::neq:
  case Binary_op::gt:
  case Binary_op::lt:
  case Binary_op::geq:
  case Binary_op::leq:
    return true;
  default:
    return false;
  }
}

Node number(double value, Source_location loc) {
  return Node(Number{value}, loc);
}

Node identifier(std::string name, Source_location loc) {
  return Node(Identifier{std::move(name)}, loc);
}

Node binary(Binary_op op, Node lhs, Node rhs, Source_location loc) {
  return Node(Binary{op, std::move(lhs), std::move(rhs)}, loc);
}

Node unary(Unary_op op, Node operand, Source_location loc) {
  return Node(Unary{op, std::move(operand)}, loc);
}

std::string signature(const Node& node) {
  return fmt::format("{}", node);
}

std::string signature(const Program& program) {
  return fmt::format("{}", program);
}

std::vector<std::string> free_variables(const Node& node) {
  std::vector<std::string> names;
  collect_identifiers(node, names);
  std::sort(names.begin(), names.end());
  names.erase(std::unique(names.begin(), names.end()), names.end());
  return names;
}

} // namespace ast

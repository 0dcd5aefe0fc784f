#include "ast.hpp"
#include "lex.hpp"
#include <fmt/format.h>

namespace {

struct Printer {
  fmt::appender out;
  int depth = 0;

  void indent() {
    for (int i = 0; i < depth; i++)
      fmt::format_to(out, "  ");
  }

  void expression(const ast::Node& node) {
    node.match(
      [&] (const ast::Number& num) { fmt::format_to(out, "{}", num.value); },
      [&] (const ast::String& str) { fmt::format_to(out, "\"{}\"", str.value); },
      [&] (const ast::Identifier& id) { fmt::format_to(out, "{}", id.name); },
      [&] (const ast::Binary& bin) {
        fmt::format_to(out, "(");
        expression(*bin.lhs);
        fmt::format_to(out, " {} ", ast::op_symbol(bin.op));
        expression(*bin.rhs);
        fmt::format_to(out, ")");
      },
      [&] (const ast::Unary& un) {
        // `henteu` needs a space before its operand, `-` must not get one
        // (a negative literal stays distinct from negation of a literal)
        if (un.op == ast::Unary_op::neg)
          fmt::format_to(out, "(-");
        else
          fmt::format_to(out, "({} ", ast::op_symbol(un.op));
        expression(*un.operand);
        fmt::format_to(out, ")");
      },
      [&] (const auto&) { statement(node); }
    );
  }

  void block(const ast::Block& statements) {
    fmt::format_to(out, "{{\n");
    depth++;
    for (auto& stmt: statements)
      statement(stmt);
    depth--;
    indent();
    fmt::format_to(out, "}}");
  }

  void statement(const ast::Node& node) {
    indent();
    node.match(
      [&] (const ast::Assignment& assign) {
        fmt::format_to(out, "{} = ", assign.name);
        expression(*assign.value);
      },
      [&] (const ast::If& cond) {
        fmt::format_to(out, "{} ", lex::kw::if_);
        expression(*cond.condition);
        fmt::format_to(out, " ");
        block(cond.then_branch);
        if (!cond.else_branch.empty()) {
          fmt::format_to(out, " {} ", lex::kw::else_);
          block(cond.else_branch);
        }
      },
      [&] (const ast::While& loop) {
        fmt::format_to(out, "{} ", lex::kw::while_);
        expression(*loop.condition);
        fmt::format_to(out, " ");
        block(loop.body);
      },
      [&] (const ast::Print& print) {
        fmt::format_to(out, "{}(", lex::kw::print);
        expression(*print.argument);
        fmt::format_to(out, ")");
      },
      [&] (const auto&) { expression(node); }
    );
    fmt::format_to(out, "\n");
  }
};

} // anon namespace

fmt::appender fmt::formatter<ast::Node>::format(const ast::Node& node, format_context& ctx) const {
  Printer printer{ ctx.out() };
  if (node.is_expression())
    printer.expression(node);
  else
    printer.statement(node);
  return printer.out;
}

fmt::appender fmt::formatter<ast::Program>::format(const ast::Program& program, format_context& ctx) const {
  Printer printer{ ctx.out() };
  for (auto& stmt: program.statements)
    printer.statement(stmt);
  return printer.out;
}

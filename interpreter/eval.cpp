#include "eval.hpp"
#include "lex.hpp"
#include <algorithm>
#include <bit>
#include <cmath>

namespace eval {

std::string_view kind_name(const Value& value) {
  return value.is<double>() ? "number" : "string";
}

double arithmetic(ast::Binary_op op, double lhs, double rhs) {
  using enum ast::Binary_op;
  switch (op) {
  case add: return lhs + rhs;
  case sub: return lhs - rhs;
  case mul: return lhs * rhs;
  case div: return lhs / rhs;
  case mod: {
    // Floored: the result takes the sign of the divisor
    double rem = std::fmod(lhs, rhs);
    if (rem != 0 && ((rem < 0) != (rhs < 0)))
      rem += rhs;
    return rem;
  }
  case pow: return std::pow(lhs, rhs);
  case equ: return lhs == rhs;
  case neq: return lhs != rhs;
  case gt: return lhs > rhs;
  case lt: return lhs < rhs;
  case geq: return lhs >= rhs;
  case leq: return lhs <= rhs;
  }
  util::unreachable();
}

double arithmetic(ast::Unary_op op, double operand) {
  switch (op) {
  case ast::Unary_op::neg: return -operand;
  case ast::Unary_op::logical_not: return operand == 0;
  }
  util::unreachable();
}

size_t Evaluator::Memo_key_hash::operator()(const Memo_key& key) const {
  size_t seed = std::hash<int>{}(key.signature_id);
  for (uint64_t bits: key.snapshot)
    seed ^= std::hash<uint64_t>{}(bits) + 0x9e3779b97f4a7c15 + (seed << 6) + (seed >> 2);
  return seed;
}

// ===========================================================================
// Statements

void Evaluator::run(const ast::Program& program) {
  node_infos.clear();
  execute_block(program.statements);
}

void Evaluator::execute_block(const ast::Block& statements) {
  for (auto& stmt: statements)
    execute(stmt);
}

bool Evaluator::truthy(const Value& value, std::string_view construct, Source_location loc) {
  auto* num = value.maybe_as<double>();
  if (!num)
    throw diag::Type_error(loc, std::string(construct), { std::string(kind_name(value)) });
  return *num != 0;
}

void Evaluator::execute(const ast::Node& stmt) {
  stmt.match(
    [&] (const ast::Assignment& assign) {
      Value value = value_of(*assign.value);
      auto* num = value.maybe_as<double>();
      if (!num)
        throw diag::Type_error(stmt.location, "=", { std::string(kind_name(value)) });
      env[assign.name] = *num;
      invalidate();
    },
    [&] (const ast::If& cond) {
      if (truthy(value_of(*cond.condition), lex::kw::if_, cond.condition->location))
        execute_block(cond.then_branch);
      else
        execute_block(cond.else_branch);
    },
    [&] (const ast::While& loop) {
      long iterations = 0;
      while (truthy(value_of(*loop.condition), lex::kw::while_, loop.condition->location)) {
        if (config.max_loop_iterations != 0 && iterations == config.max_loop_iterations)
          throw diag::Loop_limit_error(stmt.location, config.max_loop_iterations);
        iterations++;
        execute_block(loop.body);
      }
    },
    [&] (const ast::Print& print) {
      printed.push_back(value_of(*print.argument));
      if (print_callback)
        print_callback(printed.back());
    },
    [&] (const auto&) {
      // The parser never puts an expression where a statement belongs
      util::unreachable();
    }
  );
}

// ===========================================================================
// Expressions

Value Evaluator::evaluate(const ast::Node& expr) {
  node_infos.clear();
  return value_of(expr);
}

Value Evaluator::value_of(const ast::Node& expr) {
  if (!config.memoize)
    return compute(expr);

  auto key = memo_key(expr);
  if (!key)
    return compute(expr);

  if (auto it = memo.find(*key); it != memo.end()) {
    stats_.hits++;
    return it->second;
  }

  stats_.misses++;
  Value value = compute(expr);
  memo.emplace(std::move(*key), value);
  stats_.peak_memo_size = std::max(stats_.peak_memo_size, memo.size());
  return value;
}

Value Evaluator::compute(const ast::Node& expr) {
  return expr.match(
    [&] (const ast::Number& num) -> Value { return num.value; },
    [&] (const ast::String& str) -> Value { return str.value; },
    [&] (const ast::Identifier& id) -> Value {
      auto it = env.find(id.name);
      if (it == env.end())
        throw diag::Unbound_variable_error(expr.location, id.name);
      return it->second;
    },
    [&] (const ast::Binary& bin) -> Value {
      Value lhs = value_of(*bin.lhs);
      Value rhs = value_of(*bin.rhs);
      return apply(bin, lhs, rhs, expr.location);
    },
    [&] (const ast::Unary& un) -> Value {
      return apply(un, value_of(*un.operand), expr.location);
    },
    [&] (const auto&) -> Value {
      // The parser never puts a statement where an expression belongs
      util::unreachable();
    }
  );
}

Value Evaluator::apply(const ast::Binary& bin, const Value& lhs, const Value& rhs, Source_location loc) {
  using enum ast::Binary_op;
  const auto* l = lhs.maybe_as<double>();
  const auto* r = rhs.maybe_as<double>();

  if (l && r) {
    if ((bin.op == div || bin.op == mod) && *r == 0)
      throw diag::Arithmetic_error(loc, std::string(ast::op_symbol(bin.op)));
    // Also a division by zero; the sign of the zero would decide between -inf and inf
    if (bin.op == pow && *l == 0 && *r < 0)
      throw diag::Arithmetic_error(loc, std::string(ast::op_symbol(bin.op)));
    return arithmetic(bin.op, *l, *r);
  }

  if (!l && !r) {
    auto& ls = lhs.as<std::string>();
    auto& rs = rhs.as<std::string>();
    switch (bin.op) {
    case add: return ls + rs;
    case equ: return double(ls == rs);
    case neq: return double(ls != rs);
    default: break;
    }
  }

  throw diag::Type_error(loc, std::string(ast::op_symbol(bin.op)), {
    std::string(kind_name(lhs)),
    std::string(kind_name(rhs)),
  });
}

Value Evaluator::apply(const ast::Unary& un, const Value& operand, Source_location loc) {
  auto* num = operand.maybe_as<double>();
  if (!num)
    throw diag::Type_error(loc, std::string(ast::op_symbol(un.op)), { std::string(kind_name(operand)) });
  return arithmetic(un.op, *num);
}

// ===========================================================================
// Memoization

auto Evaluator::info(const ast::Node& expr) -> const Node_info& {
  if (auto it = node_infos.find(&expr); it != node_infos.end())
    return it->second;

  auto [sig, is_new] = signature_ids.try_emplace(ast::signature(expr), int(signature_ids.size()));
  (void) is_new;
  auto [it, inserted] = node_infos.emplace(&expr, Node_info{ sig->second, ast::free_variables(expr) });
  (void) inserted;
  return it->second;
}

auto Evaluator::memo_key(const ast::Node& expr) -> std::optional<Memo_key> {
  const Node_info& node = info(expr);
  Memo_key key{ node.signature_id, {} };
  key.snapshot.reserve(node.free_variables.size());
  for (auto& name: node.free_variables) {
    auto it = env.find(name);
    // Unbound: skip the cache so that evaluation fails exactly where it would without it
    if (it == env.end())
      return std::nullopt;
    key.snapshot.push_back(std::bit_cast<uint64_t>(it->second));
  }
  return key;
}

void Evaluator::invalidate() {
  if (!config.memoize)
    return;
  memo.clear();
  stats_.invalidations++;
}

} // namespace eval

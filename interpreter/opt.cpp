#include "opt.hpp"
#include "eval.hpp"
#include "util.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iterator>
#include <optional>
#include <queue>
#include <set>
#include <unordered_set>
#include <utility>

namespace opt {

namespace {

// Exponents up to this are "small" and priced per multiplication
constexpr int max_small_exponent = 8;
constexpr int pow_small_weight = 4;
constexpr int pow_flat_weight = 40;

int weight(const ast::Binary& bin) {
  using enum ast::Binary_op;
  switch (bin.op) {
  case add:
  case sub:
    return 1;
  case mul:
  case mod:
    return 2;
  case div:
    return 3;
  case pow: {
    auto* exponent = bin.rhs->maybe_as<ast::Number>();
    if (exponent && exponent->value >= 0 && exponent->value <= max_small_exponent
        && exponent->value == std::floor(exponent->value))
      return pow_small_weight * int(exponent->value);
    return pow_flat_weight;
  }
  default:
    assert(ast::is_comparison(bin.op));
    return 1;
  }
}

int block_cost(const ast::Block& block) {
  int total = 0;
  for (auto& stmt: block)
    total += cost(stmt);
  return total;
}

// ===========================================================================
// Walking the expressions of a program in a fixed order.
//
// Expressions are visited in pre-order, statements in source order. Along the
// way we track which variables are definitely assigned: a straight-line
// assignment binds its name, an `upami` binds what both branches bind, and a
// `bari` body binds nothing once the loop is done (it may never run).
// Templated on constness, so the same order serves both for finding rewrites
// and for applying one.

using Bound_set = std::set<std::string>;

template<typename Node_t, typename F>
void walk_expression(Node_t& node, const Bound_set& bound, F& visit) {
  visit(node, bound);
  if (auto* bin = node.template maybe_as<ast::Binary>()) {
    walk_expression(*bin->lhs, bound, visit);
    walk_expression(*bin->rhs, bound, visit);
  } else if (auto* un = node.template maybe_as<ast::Unary>()) {
    walk_expression(*un->operand, bound, visit);
  }
}

template<typename Block_t, typename F>
Bound_set walk_block(Block_t& block, Bound_set bound, F& visit) {
  for (auto& stmt: block) {
    if (auto* assign = stmt.template maybe_as<ast::Assignment>()) {
      walk_expression(*assign->value, bound, visit);
      bound.insert(assign->name);
    } else if (auto* cond = stmt.template maybe_as<ast::If>()) {
      walk_expression(*cond->condition, bound, visit);
      auto then_bound = walk_block(cond->then_branch, bound, visit);
      auto else_bound = walk_block(cond->else_branch, bound, visit);
      Bound_set both;
      std::set_intersection(
        then_bound.begin(), then_bound.end(),
        else_bound.begin(), else_bound.end(),
        std::inserter(both, both.end())
      );
      bound = std::move(both);
    } else if (auto* loop = stmt.template maybe_as<ast::While>()) {
      walk_expression(*loop->condition, bound, visit);
      walk_block(loop->body, bound, visit);
    } else if (auto* print = stmt.template maybe_as<ast::Print>()) {
      walk_expression(*print->argument, bound, visit);
    } else {
      walk_expression(stmt, bound, visit);
    }
  }
  return bound;
}

// ===========================================================================
// Rules. Each one looks at a single node and proposes replacements for it.

using Proposal = std::pair<std::string_view, ast::Node>;

bool is_literal(const ast::Node& node, double value) {
  auto* num = node.maybe_as<ast::Number>();
  return num && num->value == value;
}

bool contains(const ast::Node& node, auto&& predicate) {
  if (predicate(node))
    return true;
  return node.match(
    [&] (const ast::Binary& bin) { return contains(*bin.lhs, predicate) || contains(*bin.rhs, predicate); },
    [&] (const ast::Unary& un) { return contains(*un.operand, predicate); },
    [&] (const auto&) { return false; }
  );
}

// A string anywhere in `x` could make `x` raise a TypeError, which a rewrite
// must neither remove nor attribute to another operator
bool is_numeric(const ast::Node& x) {
  return !contains(x, [] (const ast::Node& n) { return n.is<ast::String>(); });
}

// `x` evaluates to a number without failing: no string, no operator that can
// divide by zero (`/`, `%` and `**`), and no variable that may still be unbound
bool always_succeeds(const ast::Node& x, const Bound_set& bound) {
  return !contains(x, [&] (const ast::Node& n) {
    if (n.is<ast::String>())
      return true;
    if (auto* id = n.maybe_as<ast::Identifier>())
      return !bound.contains(id->name);
    if (auto* bin = n.maybe_as<ast::Binary>())
      return bin->op == ast::Binary_op::div || bin->op == ast::Binary_op::mod
          || bin->op == ast::Binary_op::pow;
    return false;
  });
}

void fold_constants(const ast::Node& node, std::vector<Proposal>& out) {
  if (auto* bin = node.maybe_as<ast::Binary>()) {
    auto* lhs = bin->lhs->maybe_as<ast::Number>();
    auto* rhs = bin->rhs->maybe_as<ast::Number>();
    if (!lhs || !rhs)
      return;
    // Leave the failure to the evaluator
    bool divides = bin->op == ast::Binary_op::div || bin->op == ast::Binary_op::mod;
    if (divides && rhs->value == 0)
      return;
    if (bin->op == ast::Binary_op::pow && lhs->value == 0 && rhs->value < 0)
      return;
    double folded = eval::arithmetic(bin->op, lhs->value, rhs->value);
    out.emplace_back("constant_fold", ast::number(folded, node.location));
  } else if (auto* un = node.maybe_as<ast::Unary>()) {
    if (auto* operand = un->operand->maybe_as<ast::Number>()) {
      double folded = eval::arithmetic(un->op, operand->value);
      out.emplace_back("constant_fold", ast::number(folded, node.location));
    }
  }
}

void reduce_strength(const ast::Node& node, std::vector<Proposal>& out) {
  auto* bin = node.maybe_as<ast::Binary>();
  if (!bin || bin->op != ast::Binary_op::pow)
    return;
  if (is_literal(*bin->rhs, 2) && is_numeric(*bin->lhs)) {
    out.emplace_back("pow2_to_mul",
        ast::binary(ast::Binary_op::mul, *bin->lhs, *bin->lhs, node.location));
  }
}

void apply_identities(const ast::Node& node, const Bound_set& bound, std::vector<Proposal>& out) {
  auto* bin = node.maybe_as<ast::Binary>();
  if (!bin)
    return;
  const ast::Node& lhs = *bin->lhs;
  const ast::Node& rhs = *bin->rhs;

  const auto keep = [&] (std::string_view name, const ast::Node& x) {
    if (is_numeric(x))
      out.emplace_back(name, x);
  };
  const auto annihilate = [&] (const ast::Node& x, const ast::Node& zero) {
    if (always_succeeds(x, bound))
      out.emplace_back("mul_zero", ast::number(0, zero.location));
  };

  switch (bin->op) {
  case ast::Binary_op::mul:
    if (is_literal(rhs, 1)) keep("mul_one", lhs);
    if (is_literal(lhs, 1)) keep("mul_one", rhs);
    if (is_literal(rhs, 0)) annihilate(lhs, rhs);
    if (is_literal(lhs, 0)) annihilate(rhs, lhs);
    break;
  case ast::Binary_op::add:
    if (is_literal(rhs, 0)) keep("add_zero", lhs);
    if (is_literal(lhs, 0)) keep("add_zero", rhs);
    break;
  case ast::Binary_op::sub:
    if (is_literal(rhs, 0)) keep("sub_zero", lhs);
    break;
  case ast::Binary_op::div:
    if (is_literal(rhs, 1)) keep("div_one", lhs);
    break;
  default:
    break;
  }
}

std::vector<Proposal> proposals(Rule rule, const ast::Node& node, const Bound_set& bound) {
  std::vector<Proposal> out;
  switch (rule) {
  case Rule::constant_folding: fold_constants(node, out); break;
  case Rule::strength_reduction: reduce_strength(node, out); break;
  case Rule::algebraic_identity: apply_identities(node, bound, out); break;
  }
  return out;
}

} // anon namespace

int cost(const ast::Node& node) {
  return node.match(
    [] (const ast::Binary& bin) { return weight(bin) + cost(*bin.lhs) + cost(*bin.rhs); },
    [] (const ast::Unary& un) { return 1 + cost(*un.operand); },
    [] (const ast::Assignment& assign) { return cost(*assign.value); },
    [] (const ast::If& cond) {
      return cost(*cond.condition) + block_cost(cond.then_branch) + block_cost(cond.else_branch);
    },
    [] (const ast::While& loop) { return cost(*loop.condition) + block_cost(loop.body); },
    [] (const ast::Print& print) { return cost(*print.argument); },
    [] (const auto&) { return 0; }
  );
}

int cost(const ast::Program& program) {
  return block_cost(program.statements);
}

std::vector<Rewrite> candidates(const ast::Program& program) {
  std::vector<Rewrite> found;

  for (Rule rule: { Rule::constant_folding, Rule::strength_reduction, Rule::algebraic_identity }) {
    int position = 0;
    auto visit = [&] (const ast::Node& node, const Bound_set& bound) {
      int here = position++;
      for (auto& [name, replacement]: proposals(rule, node, bound))
        found.push_back({ rule, name, here, std::move(replacement), 0 });
    };
    walk_block(program.statements, Bound_set{}, visit);
  }

  // Priced on the whole result: a new literal can change the weight of an enclosing `**`
  for (auto& rewrite: found)
    rewrite.cost = cost(apply(program, rewrite));

  return found;
}

ast::Program apply(const ast::Program& program, const Rewrite& rewrite) {
  ast::Program result = program;
  int position = 0;
  auto visit = [&] (ast::Node& node, const Bound_set&) {
    if (position++ == rewrite.position)
      node = rewrite.replacement;
  };
  walk_block(result.statements, Bound_set{}, visit);
  return result;
}

Result optimize(const ast::Program& program, const Config& config) {
  Stats stats;
  stats.initial_cost = stats.final_cost = cost(program);
  if (!config.optimize)
    return { program, stats };

  // Every state ever reached. The frontier refers to them by index,
  // so popping never copies a tree.
  std::vector<ast::Program> states = { program };
  std::vector<int> state_costs = { stats.initial_cost };
  size_t best = 0;

  struct Entry {
    int cost;
    size_t state;
    // priority_queue is a max-heap: "less" means "popped later"
    bool operator<(const Entry& other) const {
      return std::pair(cost, state) > std::pair(other.cost, other.state);
    }
  };
  std::priority_queue<Entry> frontier;
  frontier.push({ stats.initial_cost, 0 });

  std::unordered_set<std::string> visited;

  while (!frontier.empty() && stats.states_explored < config.max_optimizer_iterations) {
    Entry entry = frontier.top();
    frontier.pop();
    if (!visited.insert(ast::signature(states[entry.state])).second)
      continue;
    stats.states_explored++;

    auto rewrites = candidates(states[entry.state]);
    const Rewrite* chosen = nullptr;
    for (auto& rewrite: rewrites) {
      if (rewrite.cost < entry.cost && (!chosen || rewrite.cost < chosen->cost))
        chosen = &rewrite;
    }
    if (!chosen)
      break; // Local optimum

    if (config.verbose) {
      LOG("optimizer: {} at node {}, cost {} -> {}",
          chosen->name, chosen->position, entry.cost, chosen->cost);
    }

    ast::Program next = apply(states[entry.state], *chosen);
    states.push_back(std::move(next));
    state_costs.push_back(chosen->cost);
    stats.applications[std::string(chosen->name)]++;
    if (chosen->cost < state_costs[best])
      best = states.size() - 1;
    frontier.push({ chosen->cost, states.size() - 1 });
  }

  stats.final_cost = state_costs[best];
  return { std::move(states[best]), stats };
}

} // namespace opt

// Cost-driven AST rewriter.
//
// Greedy best-first search over whole programs: a state's neighbors are the
// programs obtained by applying one rewrite rule at one expression node. From
// each expanded state the search commits to its cheapest strictly-cheaper
// neighbor, and stops at a local optimum or when the iteration budget runs out.
// The program is never executed.

#pragma once
#include "ast.hpp"
#include "config.hpp"
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace opt {

// In tie-breaking order
enum class Rule {
  constant_folding,
  strength_reduction,
  algebraic_identity,
};

// Static estimate of the work a tree does; leaves and statements weigh nothing
int cost(const ast::Node&);
int cost(const ast::Program&);

struct Rewrite {
  Rule rule;
  std::string_view name;  // e.g. "mul_one"
  int position;           // Pre-order index of the rewritten expression node
  ast::Node replacement;
  int cost;               // Cost of the whole program after the rewrite
};

// Every single-rule single-node rewrite of `program`, ordered by rule,
// then by node position from left to right
std::vector<Rewrite> candidates(const ast::Program& program);

// `program` with `rewrite` applied; `program` itself is untouched
ast::Program apply(const ast::Program& program, const Rewrite& rewrite);

struct Stats {
  int states_explored = 0;
  int initial_cost = 0;
  int final_cost = 0;
  std::map<std::string, int, std::less<>> applications; // By rewrite name

  int total_applications() const {
    int total = 0;
    for (auto& [name, count]: applications)
      total += count;
    return total;
  }
};

struct Result {
  ast::Program program;
  Stats stats;
};

// With `config.optimize` unset, returns `program` unchanged
Result optimize(const ast::Program& program, const Config& config);

} // namespace opt

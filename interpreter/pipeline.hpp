// The whole interpreter in one call: text -> tokens -> AST -> optimized AST -> execution.
// Failures are captured into the result instead of escaping; a failure in an
// earlier stage keeps the later ones from running.

#pragma once
#include "ast.hpp"
#include "config.hpp"
#include "diag.hpp"
#include "eval.hpp"
#include "opt.hpp"
#include "util.hpp"
#include <optional>
#include <string_view>
#include <vector>

namespace pipeline {

using Any_error = util::Variant<
  diag::Lex_error,
  diag::Parse_error,
  diag::Arithmetic_error,
  diag::Unbound_variable_error,
  diag::Type_error,
  diag::Loop_limit_error
>;

struct Run_result {
  std::vector<eval::Value> output; // Everything printed, including before a failure
  std::optional<Any_error> error;
  eval::Environment environment;
  ast::Program program;            // As executed, i.e. after optimization
  opt::Stats optimizer;
  eval::Stats evaluator;

  bool ok() const { return !error; }
  const diag::Error* failure() const;
};

Run_result run(
  std::string_view source,
  const Config& config,
  eval::Evaluator::Print_callback on_print = {}
);

} // namespace pipeline

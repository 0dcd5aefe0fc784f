#include "diag.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace diag {

std::string_view kind_name(Error_kind kind) {
  switch (kind) {
  case Error_kind::lex: return "LexError";
  case Error_kind::parse: return "ParseError";
  case Error_kind::arithmetic: return "ArithmeticError";
  case Error_kind::unbound_variable: return "UnboundVariableError";
  case Error_kind::type: return "TypeError";
  case Error_kind::loop_limit: return "LoopLimitError";
  }
  util::unreachable();
}

Lex_error::Lex_error(Source_location loc, char offending, std::string_view what):
  Error(Error_kind::lex, loc, fmt::format("{} '{}'", what, offending)),
  offending_(offending) {}

Parse_error::Parse_error(Source_location loc, std::string expected, std::string found):
  Error(Error_kind::parse, loc, fmt::format("Expected {}, found {}", expected, found)),
  expected_(std::move(expected)),
  found_(std::move(found)) {}

Arithmetic_error::Arithmetic_error(Source_location loc, std::string operation):
  Error(Error_kind::arithmetic, loc, fmt::format("'{}' by zero", operation)),
  operation_(std::move(operation)) {}

Unbound_variable_error::Unbound_variable_error(Source_location loc, std::string name):
  Error(Error_kind::unbound_variable, loc, fmt::format("Variable '{}' is not defined", name)),
  name_(std::move(name)) {}

Type_error::Type_error(Source_location loc, std::string op, std::vector<std::string> kinds):
  Error(Error_kind::type, loc,
      fmt::format("Unsupported operand kinds for '{}': {}", op, fmt::join(kinds, ", "))),
  operator_(std::move(op)),
  operand_kinds_(std::move(kinds)) {}

Loop_limit_error::Loop_limit_error(Source_location loc, long limit):
  Error(Error_kind::loop_limit, loc, fmt::format("Loop exceeded {} iterations", limit)),
  limit_(limit) {}

} // namespace diag

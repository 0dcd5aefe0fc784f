// Interpreter diagnostics: source locations and the error taxonomy.
// Every stage reports failure by throwing one of the `diag::Error` subclasses;
// none of them recovers locally.

#pragma once
#include <fmt/core.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Represents a source location in the victim Nyunda program.
// (Unrelated to `std::source_location`, which refers to the C++ program it's being used in.)
struct Source_location {
  int offset = 0;
  int line = 1;
  int column = 1;
  [[nodiscard]] Source_location next_line() const { return { offset + 1, line + 1, 1 }; }
  [[nodiscard]] Source_location next_column() const { return { offset + 1, line, column + 1 }; }
};

template<>
struct fmt::formatter<Source_location> {
  constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
  auto format(Source_location loc, format_context& ctx) const {
    return fmt::format_to(ctx.out(), "{}:{}", loc.line, loc.column);
  }
};

namespace diag {

enum class Error_kind {
  lex,
  parse,
  arithmetic,
  unbound_variable,
  type,
  loop_limit,
};

std::string_view kind_name(Error_kind);

class Error: public std::runtime_error {
  Error_kind kind_;
  Source_location location_;
public:
  Error(Error_kind kind, Source_location loc, const std::string& message):
    std::runtime_error(message), kind_(kind), location_(loc) {}

  Error_kind kind() const { return kind_; }
  Source_location location() const { return location_; }
};

// No lexical rule matches at `location`
class Lex_error: public Error {
  char offending_;
public:
  Lex_error(Source_location loc, char offending, std::string_view what);
  char offending_character() const { return offending_; }
};

// The token stream does not fit the grammar
class Parse_error: public Error {
  std::string expected_;
  std::string found_;
public:
  Parse_error(Source_location loc, std::string expected, std::string found);
  const std::string& expected() const { return expected_; }
  const std::string& found() const { return found_; }
};

// Division or modulo by zero
class Arithmetic_error: public Error {
  std::string operation_;
public:
  Arithmetic_error(Source_location loc, std::string operation);
  const std::string& operation() const { return operation_; }
};

// Read of a variable that was never assigned
class Unbound_variable_error: public Error {
  std::string name_;
public:
  Unbound_variable_error(Source_location loc, std::string name);
  const std::string& name() const { return name_; }
};

// Operator applied to operand kinds it does not support
class Type_error: public Error {
  std::string operator_;
  std::vector<std::string> operand_kinds_;
public:
  Type_error(Source_location loc, std::string op, std::vector<std::string> operand_kinds);
  const std::string& op() const { return operator_; }
  const std::vector<std::string>& operand_kinds() const { return operand_kinds_; }
};

// A `bari` loop ran past the configured iteration ceiling
class Loop_limit_error: public Error {
  long limit_;
public:
  Loop_limit_error(Source_location loc, long limit);
  long limit() const { return limit_; }
};

} // namespace diag

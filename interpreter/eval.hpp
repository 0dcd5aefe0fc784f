// Memoizing tree-walking evaluator.
//
// An `Evaluator` executes one program against an `Environment` it is handed.
// With `Config::memoize`, every expression subtree is looked up in a memo table
// before being evaluated. The key is the subtree's canonical signature plus the
// current values of the variables occurring in it; both parts are derived once
// per node and kept alongside it. Any assignment clears the table.

#pragma once
#include "ast.hpp"
#include "config.hpp"
#include "util.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace eval {

using Value = util::Variant<double, std::string>;
std::string_view kind_name(const Value&);

using Environment = std::map<std::string, double>;

// The evaluator's arithmetic on numbers, shared with constant folding.
// Division and modulo expect a nonzero `rhs`; modulo is floored.
double arithmetic(ast::Binary_op, double lhs, double rhs);
double arithmetic(ast::Unary_op, double operand);

struct Stats {
  long hits = 0;
  long misses = 0;
  long invalidations = 0;
  size_t peak_memo_size = 0;

  double hit_rate() const {
    long lookups = hits + misses;
    return lookups ? double(hits) / double(lookups) : 0.0;
  }
};

class Evaluator {
public:
  using Print_callback = std::function<void(const Value&)>;

  Evaluator(const Config& config_, Environment& env_): config(config_), env(env_) {}

  // Called with every printed value, as soon as it is printed
  void on_print(Print_callback callback) { print_callback = std::move(callback); }

  // `program` must stay alive and unmodified for as long as this evaluator is used.
  // Throws `diag::Error`; output printed before the failure is kept.
  void run(const ast::Program& program);

  // `expression` must stay alive for the duration of the call
  Value evaluate(const ast::Node& expression);

  const std::vector<Value>& output() const { return printed; }
  const Stats& stats() const { return stats_; }

private:
  struct Memo_key {
    int signature_id;
    std::vector<uint64_t> snapshot; // Bit patterns, so that -0.0 and 0.0 differ
    bool operator==(const Memo_key&) const = default;
  };

  struct Memo_key_hash {
    size_t operator()(const Memo_key&) const;
  };

  struct Node_info {
    int signature_id;
    std::vector<std::string> free_variables;
  };

  const Config& config;
  Environment& env;
  Print_callback print_callback;
  std::vector<Value> printed;
  Stats stats_;

  std::unordered_map<Memo_key, Value, Memo_key_hash> memo;
  // Valid for the tree of the current `run` or `evaluate` call only
  std::unordered_map<const ast::Node*, Node_info> node_infos;
  std::unordered_map<std::string, int> signature_ids;

  void execute(const ast::Node& statement);
  void execute_block(const ast::Block&);
  bool truthy(const Value&, std::string_view construct, Source_location);

  Value value_of(const ast::Node& expression);
  Value compute(const ast::Node& expression);
  Value apply(const ast::Binary&, const Value& lhs, const Value& rhs, Source_location);
  Value apply(const ast::Unary&, const Value& operand, Source_location);

  const Node_info& info(const ast::Node&);
  std::optional<Memo_key> memo_key(const ast::Node&);
  void invalidate();
};

} // namespace eval

template<>
struct fmt::formatter<eval::Value> {
  constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
  auto format(const eval::Value& value, format_context& ctx) const {
    return value.match(
      // -0 prints as 0: rewrites such as `0 * x -> 0` must not show up in output
      [&] (double num) { return fmt::format_to(ctx.out(), "{}", num == 0 ? 0.0 : num); },
      [&] (const std::string& str) { return fmt::format_to(ctx.out(), "{}", str); }
    );
  }
};

#include "pipeline.hpp"
#include "parse.hpp"

namespace pipeline {

namespace {

template<typename F>
void capture_errors(Run_result& result, F&& stage) {
  try {
    stage();
  } catch (const diag::Lex_error& e) {
    result.error.emplace(e);
  } catch (const diag::Parse_error& e) {
    result.error.emplace(e);
  } catch (const diag::Arithmetic_error& e) {
    result.error.emplace(e);
  } catch (const diag::Unbound_variable_error& e) {
    result.error.emplace(e);
  } catch (const diag::Type_error& e) {
    result.error.emplace(e);
  } catch (const diag::Loop_limit_error& e) {
    result.error.emplace(e);
  }
}

} // anon namespace

const diag::Error* Run_result::failure() const {
  if (!error)
    return nullptr;
  return error->match([] (const diag::Error& e) { return &e; });
}

Run_result run(std::string_view source, const Config& config, eval::Evaluator::Print_callback on_print) {
  Run_result result;

  std::optional<ast::Program> parsed;
  capture_errors(result, [&] { parsed = parse::parse_source(source); });
  if (!parsed)
    return result;
  if (config.verbose)
    LOG("parsed {} statements, cost {}", parsed->statements.size(), opt::cost(*parsed));

  auto optimized = opt::optimize(*parsed, config);
  result.optimizer = optimized.stats;
  result.program = std::move(optimized.program);
  if (config.verbose && config.optimize)
    LOG("optimized to cost {} in {} states", result.optimizer.final_cost, result.optimizer.states_explored);

  eval::Evaluator evaluator(config, result.environment);
  evaluator.on_print(std::move(on_print));
  capture_errors(result, [&] { evaluator.run(result.program); });

  result.output = evaluator.output();
  result.evaluator = evaluator.stats();
  return result;
}

} // namespace pipeline

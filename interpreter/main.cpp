#include "diag.hpp"
#include "pipeline.hpp"
#include "util.hpp"
#include <charconv>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

namespace {

constexpr std::string_view usage =
  "Usage: {} [-v|--verbose] [--no-greedy] [--no-dp] [--max-loop N] [file.nyunda]\n"
  "  --verbose    trace the pipeline and print a performance report\n"
  "  --no-greedy  disable the greedy best-first AST optimizer\n"
  "  --no-dp      disable memoized expression evaluation\n"
  "  --max-loop N stop any 'bari' loop after N iterations\n"
  "Without a file, runs a built-in demo in verbose mode.";

// Factorial of 6, should print 720
constexpr std::string_view demo_source = R"(
# Ngitung faktorial 6
n = 6
hasil = 1

# Ieu loop pikeun ngitung faktorial
bari n > 0 {
  hasil = hasil * n
  n = n - 1
}

cetak(hasil)
)";

std::string get_whole_file(const char* filename) {
  std::ifstream f(filename, std::ios::binary);
  if (!f)
    FATAL("Cannot open '{}'", filename);
  std::ostringstream contents;
  contents << f.rdbuf();
  if (!f)
    FATAL("Failed to read '{}'", filename);
  return contents.str();
}

void report(const pipeline::Run_result& result, const Config& config) {
  LOG("--- Performance & optimization report ---");

  LOG("Greedy optimization:");
  if (config.optimize) {
    auto& stats = result.optimizer;
    LOG("  - States explored: {}", stats.states_explored);
    LOG("  - Rewrites applied: {}", stats.total_applications());
    for (auto& [name, count]: stats.applications)
      LOG("      {}: {}", name, count);
    LOG("  - Cost: {} -> {}", stats.initial_cost, stats.final_cost);
  } else {
    LOG("  - Disabled");
  }

  LOG("Memoization:");
  if (config.memoize) {
    auto& memo = result.evaluator;
    LOG("  - Subproblems solved: {}", memo.misses);
    LOG("  - Cache hits: {}", memo.hits);
    LOG("  - Hit rate: {:.2f}%", memo.hit_rate() * 100);
    LOG("  - Invalidations: {}", memo.invalidations);
    LOG("  - Peak table size: {}", memo.peak_memo_size);
  } else {
    LOG("  - Disabled");
  }
}

} // anon namespace

int main(int argc, char** argv) {
  Config config;
  const char* filename = nullptr;

  for (int i = 1; i < argc; i++) {
    std::string_view arg = argv[i];
    if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else if (arg == "--no-greedy") {
      config.optimize = false;
    } else if (arg == "--no-dp") {
      config.memoize = false;
    } else if (arg == "--max-loop") {
      if (++i == argc)
        FATAL("--max-loop needs a number");
      std::string_view value = argv[i];
      auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), config.max_loop_iterations);
      if (ec != std::errc{} || ptr != value.data() + value.size() || config.max_loop_iterations < 0)
        FATAL("Bad --max-loop value '{}'", value);
    } else if (arg == "-h" || arg == "--help") {
      fmt::print(fmt::runtime(usage), argv[0]);
      fmt::print("\n");
      return 0;
    } else if (arg.starts_with('-')) {
      FATAL("Unknown option '{}'. Try '{} --help'", arg, argv[0]);
    } else if (filename) {
      FATAL("Only one source file is accepted, got '{}' and '{}'", filename, arg);
    } else {
      filename = argv[i];
    }
  }

  std::string source;
  if (filename) {
    source = get_whole_file(filename);
    if (config.verbose)
      LOG("--- Running {} ---", filename);
  } else {
    LOG("No file provided. Running the built-in demo in verbose mode.");
    source = demo_source;
    config.verbose = true;
  }

  auto result = pipeline::run(source, config, [] (const eval::Value& value) {
    fmt::print("{}\n", value);
    std::fflush(stdout);
  });

  if (config.verbose)
    report(result, config);

  if (auto* error = result.failure()) {
    LOG("Error at {}: {}: {}", error->location(), diag::kind_name(error->kind()), error->what());
    return 1;
  }
}

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "eval.hpp"
#include "opt.hpp"
#include "parse.hpp"

static int cost_of(std::string_view source) {
  return opt::cost(parse::parse_source(source));
}

static std::vector<std::string> names(const std::vector<opt::Rewrite>& rewrites) {
  std::vector<std::string> result;
  for (auto& rewrite: rewrites)
    result.emplace_back(rewrite.name);
  return result;
}

static std::vector<std::string> candidate_names(std::string_view source) {
  return names(opt::candidates(parse::parse_source(source)));
}

static opt::Result optimized(std::string_view source, Config config = {}) {
  return opt::optimize(parse::parse_source(source), config);
}

// Printed values, then the kind of the error if there was one
static std::string outcome(const ast::Program& program, eval::Environment env) {
  Config config;
  config.max_loop_iterations = 100;
  eval::Evaluator evaluator(config, env);
  std::string result;
  try {
    evaluator.run(program);
  } catch (const diag::Error& e) {
    result = std::string(diag::kind_name(e.kind()));
  }
  for (auto& value: evaluator.output())
    result += fmt::format(" {}", value);
  return result;
}

TEST(Cost, Weights) {
  EXPECT_EQ(cost_of("x = 1"), 0);
  EXPECT_EQ(cost_of("cetak(a + b - c)"), 2);
  EXPECT_EQ(cost_of("cetak(a * b % c)"), 4);
  EXPECT_EQ(cost_of("cetak(a / b)"), 3);
  EXPECT_EQ(cost_of("cetak(-a)"), 1);
  EXPECT_EQ(cost_of("cetak(henteu (a < b))"), 2);
  EXPECT_EQ(cost_of("cetak(a == b != c >= d)"), 3);
}

TEST(Cost, ExponentDependsOnLiteral) {
  EXPECT_EQ(cost_of("cetak(x ** 0)"), 0);
  EXPECT_EQ(cost_of("cetak(x ** 2)"), 8);
  EXPECT_EQ(cost_of("cetak(x ** 8)"), 32);
  EXPECT_EQ(cost_of("cetak(x ** 9)"), 40);
  EXPECT_EQ(cost_of("cetak(x ** 2.5)"), 40);
  EXPECT_EQ(cost_of("cetak(x ** y)"), 40);
  EXPECT_EQ(cost_of("cetak(x ** -1)"), 41);
}

TEST(Cost, StatementsAddUpTheirExpressions) {
  EXPECT_EQ(cost_of("upami a + 1 { b = c * 2 } sanes { cetak(c / 2) }\nbari a > 0 { a = a - 1 }"), 8);
}

TEST(Optimizer, RemovesIdentitiesOneStepAtATime) {
  auto result = optimized("x = 3\ncetak(x * 1 + 0)");
  EXPECT_EQ(ast::signature(result.program), "x = 3\ncetak(x)\n");
  EXPECT_EQ(result.stats.initial_cost, 3);
  EXPECT_EQ(result.stats.final_cost, 0);
  EXPECT_EQ(result.stats.states_explored, 3);
  EXPECT_EQ(result.stats.applications.at("mul_one"), 1);
  EXPECT_EQ(result.stats.applications.at("add_zero"), 1);
  EXPECT_EQ(result.stats.total_applications(), 2);
}

TEST(Optimizer, CommitsToCheapestNeighbor) {
  auto rewrites = opt::candidates(parse::parse_source("x = 3\ncetak(x * 1 + 0)"));
  ASSERT_EQ(names(rewrites), (std::vector<std::string>{ "add_zero", "mul_one" }));
  EXPECT_EQ(rewrites[0].cost, 2);
  EXPECT_EQ(rewrites[1].cost, 1);
  EXPECT_EQ(rewrites[1].position, 2);
}

TEST(Optimizer, FoldsConstants) {
  auto result = optimized("cetak(2 + 3 * 4)\ncetak(-2 ** 2)\ncetak(henteu (1 < 2))\ncetak(-7 % 3)");
  EXPECT_EQ(ast::signature(result.program), "cetak(14)\ncetak(4)\ncetak(0)\ncetak(2)\n");
  EXPECT_EQ(result.stats.final_cost, 0);
}

TEST(Optimizer, FoldedExponentIsRepriced) {
  auto rewrites = opt::candidates(parse::parse_source("cetak(x ** (1 + 1))"));
  ASSERT_EQ(names(rewrites), std::vector<std::string>{ "constant_fold" });
  EXPECT_EQ(rewrites[0].cost, 8);

  auto result = optimized("cetak(x ** (1 + 1))");
  EXPECT_EQ(ast::signature(result.program), "cetak((x * x))\n");
  EXPECT_EQ(result.stats.final_cost, 2);
}

TEST(Optimizer, DoesNotFoldDivisionByZero) {
  EXPECT_TRUE(candidate_names("cetak(4 / 0)").empty());
  EXPECT_TRUE(candidate_names("cetak(4 % 0)").empty());
  auto result = optimized("cetak(1 + 4 / 0)");
  EXPECT_EQ(ast::signature(result.program), "cetak((1 + (4 / 0)))\n");
}

TEST(Optimizer, DoesNotFoldZeroToNegativePower) {
  auto result = optimized("cetak(0 ** -1)\ncetak(0 ** 2)");
  EXPECT_EQ(ast::signature(result.program), "cetak((0 ** -1))\ncetak(0)\n");
}

TEST(Optimizer, SquareBecomesMultiplication) {
  EXPECT_EQ(candidate_names("cetak(x ** 2)"), std::vector<std::string>{ "pow2_to_mul" });
  EXPECT_TRUE(candidate_names("cetak(x ** 3)").empty());
  EXPECT_TRUE(candidate_names("cetak(\"a\" ** 2)").empty());

  auto result = optimized("cetak((x + 1) ** 2)");
  EXPECT_EQ(ast::signature(result.program), "cetak(((x + 1) * (x + 1)))\n");
  EXPECT_EQ(result.stats.initial_cost, 9);
  EXPECT_EQ(result.stats.final_cost, 4);
}

TEST(Optimizer, Identities) {
  EXPECT_EQ(ast::signature(optimized("cetak(1 * x)").program), "cetak(x)\n");
  EXPECT_EQ(ast::signature(optimized("cetak(0 + x)").program), "cetak(x)\n");
  EXPECT_EQ(ast::signature(optimized("cetak(x - 0)").program), "cetak(x)\n");
  EXPECT_EQ(ast::signature(optimized("cetak(x / 1)").program), "cetak(x)\n");
  // Not identities
  EXPECT_TRUE(candidate_names("cetak(0 - x)").empty());
  EXPECT_TRUE(candidate_names("cetak(1 / x)").empty());
}

TEST(Optimizer, IdentitiesKeepTypeErrors) {
  EXPECT_TRUE(candidate_names("cetak(\"a\" * 1)").empty());
  EXPECT_TRUE(candidate_names("cetak(\"a\" + 0)").empty());
  EXPECT_TRUE(candidate_names("cetak((\"a\" + \"b\") - 0)").empty());
}

TEST(Optimizer, MultiplyByZeroNeedsABoundOperand) {
  EXPECT_TRUE(candidate_names("cetak(y * 0)").empty());
  EXPECT_EQ(ast::signature(optimized("y = 1\ncetak(y * 0)").program), "y = 1\ncetak(0)\n");
  EXPECT_EQ(ast::signature(optimized("y = 1\ncetak(0 * (y + 2))").program), "y = 1\ncetak(0)\n");
}

TEST(Optimizer, MultiplyByZeroKeepsFailures) {
  EXPECT_TRUE(candidate_names("y = 1\ncetak((y / y) * 0)").empty());
  EXPECT_TRUE(candidate_names("y = 1\ncetak((y % 2) * 0)").empty());
  EXPECT_TRUE(candidate_names("cetak(\"a\" * 0)").empty());
  EXPECT_EQ(candidate_names("y = 1\ncetak((y ** -1) * 0)"), std::vector<std::string>{ "constant_fold" });
}

TEST(Optimizer, LoopBodyDoesNotBind) {
  EXPECT_TRUE(candidate_names("bari palsu { z = 1 }\ncetak(z * 0)").empty());
  EXPECT_EQ(candidate_names("bari palsu { z = 1\ncetak(z * 0) }"), std::vector<std::string>{ "mul_zero" });
}

TEST(Optimizer, ConditionalBindsWhatBothBranchesBind) {
  EXPECT_EQ(candidate_names("upami leres { z = 1 } sanes { z = 2 }\ncetak(z * 0)"),
      std::vector<std::string>{ "mul_zero" });
  EXPECT_TRUE(candidate_names("upami leres { z = 1 }\ncetak(z * 0)").empty());
  EXPECT_TRUE(candidate_names("upami leres { z = 1 } sanes { w = 2 }\ncetak(z * 0)").empty());
}

TEST(Optimizer, FoldingWinsTies) {
  auto rewrites = opt::candidates(parse::parse_source("cetak((2 + 3) + 0)"));
  ASSERT_EQ(names(rewrites), (std::vector<std::string>{ "constant_fold", "add_zero" }));
  EXPECT_EQ(rewrites[0].rule, opt::Rule::constant_folding);
  EXPECT_EQ(rewrites[0].cost, rewrites[1].cost);

  auto result = optimized("cetak((2 + 3) + 0)");
  EXPECT_EQ(ast::signature(result.program), "cetak(5)\n");
  EXPECT_EQ(result.stats.applications.at("constant_fold"), 2);
  EXPECT_EQ(result.stats.applications.count("add_zero"), 0u);
}

TEST(Optimizer, ApplyLeavesInputAlone) {
  auto program = parse::parse_source("x = 3\ncetak(x * 1 + 0)");
  auto before = ast::signature(program);
  auto rewrites = opt::candidates(program);
  ASSERT_FALSE(rewrites.empty());
  auto after = opt::apply(program, rewrites.back());
  EXPECT_EQ(ast::signature(program), before);
  EXPECT_EQ(ast::signature(after), "x = 3\ncetak((x + 0))\n");
  EXPECT_EQ(opt::cost(after), rewrites.back().cost);
}

TEST(Optimizer, Disabled) {
  Config config;
  config.optimize = false;
  auto result = optimized("x = 3\ncetak(x * 1 + 0)", config);
  EXPECT_EQ(ast::signature(result.program), "x = 3\ncetak(((x * 1) + 0))\n");
  EXPECT_EQ(result.stats.states_explored, 0);
  EXPECT_EQ(result.stats.initial_cost, 3);
  EXPECT_EQ(result.stats.final_cost, 3);
  EXPECT_EQ(result.stats.total_applications(), 0);
}

TEST(Optimizer, IterationBudget) {
  Config config;
  config.max_optimizer_iterations = 1;
  auto result = optimized("x = 3\ncetak(x * 1 + 0)", config);
  EXPECT_EQ(result.stats.states_explored, 1);
  EXPECT_EQ(ast::signature(result.program), "x = 3\ncetak((x + 0))\n");
  EXPECT_EQ(result.stats.final_cost, 1);
}

TEST(Optimizer, NeverRaisesCost) {
  const char* sources[] = {
    "cetak(x ** y)",
    "a = 2\nb = a ** 2 * 1 + 0 * a\ncetak(b / 1 - 0)",
    "upami 1 + 1 == 2 { cetak(3 * 3) } lamun x { cetak(x ** 2) }",
    "i = 0\nbari i < 10 { i = i + 1 * 1 }",
  };
  for (const char* source: sources) {
    auto result = optimized(source);
    EXPECT_LE(result.stats.final_cost, result.stats.initial_cost) << source;
    EXPECT_EQ(opt::cost(result.program), result.stats.final_cost) << source;
  }
}

TEST(Optimizer, RewritesPreserveBehavior) {
  const char* sources[] = {
    "cetak(a * 1 + 0)",
    "cetak(a ** 2 - b / 1)",
    "y = a\ncetak(y * 0 + (2 * 3 - 6))",
    "upami a > 0 { z = a } sanes { z = 1 }\ncetak(0 * z + z ** 2)",
    "cetak(b % 1 * 1)",
    "cetak((a - 0) / (b * 1))",
    "cetak(henteu (a * 1) == 0 - 0)",
    "cetak(\"s\" + 0)\ncetak(c * 0)",
    "i = 0\nbari i < 3 { i = i + 1 * 1\ncetak(i * 0 + a) }",
    "y = a\ncetak((y * 0) ** -1)",
    "y = a\ncetak((y * 0 + 0) ** (b - 1) > 0)",
    "y = b\ncetak(y ** -1 * 0)",
  };
  const double samples[] = { -2, -0.0, 0, 0.5, 3 };

  for (const char* source: sources) {
    auto program = parse::parse_source(source);
    auto whole = opt::optimize(program, Config{}).program;
    auto rewrites = opt::candidates(program);
    for (double a: samples) {
      for (double b: samples) {
        eval::Environment env = { { "a", a }, { "b", b } };
        auto expected = outcome(program, env);
        EXPECT_EQ(outcome(whole, env), expected) << source << " a=" << a << " b=" << b;
        for (auto& rewrite: rewrites) {
          EXPECT_EQ(outcome(opt::apply(program, rewrite), env), expected)
            << source << " with " << rewrite.name << " at " << rewrite.position;
        }
      }
    }
  }
}

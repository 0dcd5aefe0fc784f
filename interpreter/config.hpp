#pragma once

// Knobs shared by all stages of one run
struct Config {
  bool optimize = true;  // run the greedy rewriter before evaluation
  bool memoize = true;   // cache expression results in the evaluator
  bool verbose = false;  // trace stages to stderr

  int max_optimizer_iterations = 1000;

  // Iteration ceiling for a single execution of a `bari` loop; 0 is unbounded
  long max_loop_iterations = 0;
};

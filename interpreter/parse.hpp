// Nyunda recursive-descent parser: one function per nonterminal,
// one token of lookahead, no backtracking.

#pragma once
#include "ast.hpp"
#include "lex.hpp"
#include <string_view>
#include <vector>

namespace parse {

// `tokens` must end with the `eof` token, as produced by `lex::tokenize`
ast::Program parse(const std::vector<lex::Token>& tokens);

// tokenize + parse
ast::Program parse_source(std::string_view source);

} // namespace parse

/**
 * Name: nestport::group::flatten
 * Purpose: Reproduce the flat token sequence a grouped tree was built from.
 */
#pragma once

#include <string>
#include <vector>
#include "grouping/Element.h"
#include "grouping/TokenGroup.h"
#include "lexer/Token.h"

namespace nestport::group {

// Depth-first; bracket tokens are kept, only the synthetic group nodes disappear
std::vector<lex::Token> flatten(const TokenGroup& group);

void appendFlattened(const Element& element, std::vector<lex::Token>& out);

// Literal text used in diagnostics: token text, or the opening bracket of a group
std::string describe(const Element& element);

} // namespace nestport::group

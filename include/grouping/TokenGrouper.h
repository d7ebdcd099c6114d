/***
 * Name: nestport::group::TokenGrouper
 * Purpose: Collapse every matched bracket pair of a flat token sequence into a TokenGroup.
 * Inputs:
 *   - Token vector from the Lexer (End-terminated or not)
 * Outputs:
 *   - Root TokenGroup whose children are the top-level elements
 * Theory of Operation:
 *   Single left-to-right pass with an explicit stack of open groups. Curly, round
 *   and square brackets must nest; violations raise UnbalancedBracketError naming
 *   the unmatched close or the innermost unclosed open. A '<' opens an Angle group
 *   only when a forward scan over type-argument tokens finds its matching '>';
 *   otherwise it stays an operator token. No other validation happens here.
 */
#pragma once

#include <cstddef>
#include <vector>
#include "grouping/TokenGroup.h"
#include "lexer/Token.h"

namespace nestport::group {

class TokenGrouper {
public:
    static TokenGroup group(const std::vector<lex::Token>& tokens);

    // Index of the '>' closing the type-argument list opened at tokens[open], or npos
    static std::size_t matchAngle(const std::vector<lex::Token>& tokens, std::size_t open);
};

} // namespace nestport::group

/**
 * Name: nestport::group::TokenGroup
 * Purpose: A bracket pair collapsed into one structural unit.
 */
#pragma once

#include <vector>
#include "grouping/Element.h"
#include "grouping/GroupKind.h"
#include "lexer/Token.h"

namespace nestport::group {

struct TokenGroup {
    GroupKind kind{GroupKind::Root};
    lex::Token open{}; // unset for Root
    lex::Token close{}; // unset for Root
    std::vector<Element> children{};
};

} // namespace nestport::group

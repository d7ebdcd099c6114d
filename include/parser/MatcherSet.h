/***
 * Name: nestport::parse::MatcherSet
 * Purpose: The member matchers in fixed priority order.
 */
#pragma once

#include <memory>
#include <vector>
#include "parser/Matcher.h"

namespace nestport::parse {

// Field, method, nested class, static initializer, instance initializer, constructor
const std::vector<std::unique_ptr<Matcher>>& memberMatchers();

const Matcher& enumConstantMatcher();

} // namespace nestport::parse

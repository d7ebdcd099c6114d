/***
 * Name: nestport::parse::memberMatchers
 * Purpose: Process-wide, immutable matcher instances in priority order.
 */
#include "parser/MatcherSet.h"
#include "parser/matchers/ConstructorMatcher.h"
#include "parser/matchers/EnumConstantMatcher.h"
#include "parser/matchers/FieldMatcher.h"
#include "parser/matchers/InitializerMatchers.h"
#include "parser/matchers/MethodMatcher.h"
#include "parser/matchers/NestedClassMatcher.h"

namespace nestport::parse {

namespace {
std::vector<std::unique_ptr<Matcher>> buildMatchers() {
  std::vector<std::unique_ptr<Matcher>> out;
  out.push_back(std::make_unique<FieldMatcher>());
  out.push_back(std::make_unique<MethodMatcher>());
  out.push_back(std::make_unique<NestedClassMatcher>());
  out.push_back(std::make_unique<StaticInitializerMatcher>());
  out.push_back(std::make_unique<InstanceInitializerMatcher>());
  out.push_back(std::make_unique<ConstructorMatcher>());
  return out;
}
} // namespace

const std::vector<std::unique_ptr<Matcher>>& memberMatchers() {
  static const std::vector<std::unique_ptr<Matcher>> matchers = buildMatchers();
  return matchers;
}

const Matcher& enumConstantMatcher() {
  static const EnumConstantMatcher matcher;
  return matcher;
}

} // namespace nestport::parse

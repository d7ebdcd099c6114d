/***
 * Name: nestport::parse::ConstructorMatcher
 * Purpose: `[modifiers] [<T>] ClassName (params) [throws X] { body }`
 * Theory of Operation: The name must equal the enclosing class name, so this
 *   never matches inside anonymous classes.
 */
#pragma once

#include "parser/Matcher.h"

namespace nestport::parse {

class ConstructorMatcher final : public Matcher {
 public:
  const char* name() const override { return "constructor"; }
  std::unique_ptr<ast::Node> parse(TokenInputStream& stream, const BodyContext& ctx) const override;

 protected:
  bool recognize(TokenInputStream& peek, const BodyContext& ctx) const override;
  void finish(TokenInputStream& peek) const override;
};

} // namespace nestport::parse

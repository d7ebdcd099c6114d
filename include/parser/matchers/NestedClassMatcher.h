/***
 * Name: nestport::parse::NestedClassMatcher
 * Purpose: Member class, interface or enum declaration.
 */
#pragma once

#include "parser/Matcher.h"

namespace nestport::parse {

class NestedClassMatcher final : public Matcher {
 public:
  const char* name() const override { return "nested class"; }
  std::unique_ptr<ast::Node> parse(TokenInputStream& stream, const BodyContext& ctx) const override;

 protected:
  bool recognize(TokenInputStream& peek, const BodyContext& ctx) const override;
  void finish(TokenInputStream& peek) const override;
};

} // namespace nestport::parse

/***
 * Name: nestport::parse::StaticInitializerMatcher / InstanceInitializerMatcher
 * Purpose: `static { ... }` and bare `{ ... }` blocks at member level.
 */
#pragma once

#include "parser/Matcher.h"

namespace nestport::parse {

class StaticInitializerMatcher final : public Matcher {
 public:
  const char* name() const override { return "static initializer"; }
  std::unique_ptr<ast::Node> parse(TokenInputStream& stream, const BodyContext& ctx) const override;

 protected:
  bool recognize(TokenInputStream& peek, const BodyContext& ctx) const override;
  void finish(TokenInputStream& peek) const override;
};

class InstanceInitializerMatcher final : public Matcher {
 public:
  const char* name() const override { return "instance initializer"; }
  std::unique_ptr<ast::Node> parse(TokenInputStream& stream, const BodyContext& ctx) const override;

 protected:
  bool recognize(TokenInputStream& peek, const BodyContext& ctx) const override;
  void finish(TokenInputStream& peek) const override;
};

} // namespace nestport::parse

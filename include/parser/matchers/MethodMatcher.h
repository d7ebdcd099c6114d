/***
 * Name: nestport::parse::MethodMatcher
 * Purpose: `[modifiers] [<T>] (void|Type) name (params) [dims] [throws X] ({body}|;)`
 */
#pragma once

#include "parser/Matcher.h"

namespace nestport::parse {

class MethodMatcher final : public Matcher {
 public:
  const char* name() const override { return "method"; }
  std::unique_ptr<ast::Node> parse(TokenInputStream& stream, const BodyContext& ctx) const override;

 protected:
  bool recognize(TokenInputStream& peek, const BodyContext& ctx) const override;
  void finish(TokenInputStream& peek) const override;
};

} // namespace nestport::parse

/***
 * Name: nestport::parse::FieldMatcher
 * Purpose: `[modifiers] Type name [dims] [= init] {, name [dims] [= init]} ;`
 */
#pragma once

#include "parser/Matcher.h"

namespace nestport::parse {

class FieldMatcher final : public Matcher {
 public:
  const char* name() const override { return "field"; }
  std::unique_ptr<ast::Node> parse(TokenInputStream& stream, const BodyContext& ctx) const override;

 protected:
  bool recognize(TokenInputStream& peek, const BodyContext& ctx) const override;
  void finish(TokenInputStream& peek) const override;
};

} // namespace nestport::parse

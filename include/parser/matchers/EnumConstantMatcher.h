/***
 * Name: nestport::parse::EnumConstantMatcher
 * Purpose: `[@Ann] NAME [(args)] [{ body }]` followed by ',' ';' or the end of the body.
 * Theory of Operation: Only consulted in the leading constant section of an
 *   enum body; the trailing ',' belongs to the constant.
 */
#pragma once

#include "parser/Matcher.h"

namespace nestport::parse {

class EnumConstantMatcher final : public Matcher {
 public:
  const char* name() const override { return "enum constant"; }
  std::unique_ptr<ast::Node> parse(TokenInputStream& stream, const BodyContext& ctx) const override;

 protected:
  bool recognize(TokenInputStream& peek, const BodyContext& ctx) const override;
  void finish(TokenInputStream& peek) const override;
};

} // namespace nestport::parse

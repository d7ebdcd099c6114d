/***
 * Name: nestport::parse::StaticInitializerMatcher / InstanceInitializerMatcher (impl)
 */
#include "parser/matchers/InitializerMatchers.h"
#include "ast/InstanceInitializer.h"
#include "ast/StaticInitializer.h"
#include "parser/OpaqueBodyBuilder.h"
#include "parser/Syntax.h"

namespace nestport::parse {

using TK = lex::TokenKind;
using group::GroupKind;

bool StaticInitializerMatcher::recognize(TokenInputStream& peek, const BodyContext&) const {
  if (!peek.at(TK::Static)) { return false; }
  peek.advance();
  return peek.atGroup(GroupKind::Curly);
}

void StaticInitializerMatcher::finish(TokenInputStream& peek) const { peek.advance(); }

std::unique_ptr<ast::Node> StaticInitializerMatcher::parse(TokenInputStream& stream, const BodyContext&) const {
  auto init = std::make_unique<ast::StaticInitializer>();
  syntax::locate(*init, stream.here());
  stream.expect(TK::Static, "'static'");
  init->body = OpaqueBodyBuilder::fromGroup(stream.expectGroup(GroupKind::Curly, "initializer block"));
  return init;
}

bool InstanceInitializerMatcher::recognize(TokenInputStream& peek, const BodyContext&) const {
  return peek.atGroup(GroupKind::Curly);
}

void InstanceInitializerMatcher::finish(TokenInputStream& peek) const { peek.advance(); }

std::unique_ptr<ast::Node> InstanceInitializerMatcher::parse(TokenInputStream& stream, const BodyContext&) const {
  auto init = std::make_unique<ast::InstanceInitializer>();
  syntax::locate(*init, stream.here());
  init->body = OpaqueBodyBuilder::fromGroup(stream.expectGroup(GroupKind::Curly, "initializer block"));
  return init;
}

} // namespace nestport::parse

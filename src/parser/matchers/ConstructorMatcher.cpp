/***
 * Name: nestport::parse::ConstructorMatcher (impl)
 */
#include "parser/matchers/ConstructorMatcher.h"
#include "ast/ConstructorDecl.h"
#include "parser/OpaqueBodyBuilder.h"
#include "parser/Syntax.h"

namespace nestport::parse {

using TK = lex::TokenKind;
using group::GroupKind;

bool ConstructorMatcher::recognize(TokenInputStream& peek, const BodyContext& ctx) const {
  if (ctx.className.empty()) { return false; }
  syntax::skipModifiers(peek);
  if (peek.atGroup(GroupKind::Angle)) { peek.advance(); }
  if (!peek.atIdent(ctx.className)) { return false; }
  peek.advance();
  if (!peek.atGroup(GroupKind::Round)) { return false; }
  peek.advance();
  return peek.at(TK::Throws) || peek.atGroup(GroupKind::Curly);
}

void ConstructorMatcher::finish(TokenInputStream& peek) const {
  while (peek.hasNext()) {
    const bool body = peek.atGroup(GroupKind::Curly);
    peek.advance();
    if (body) { return; }
  }
}

std::unique_ptr<ast::Node> ConstructorMatcher::parse(TokenInputStream& stream, const BodyContext&) const {
  auto ctor = std::make_unique<ast::ConstructorDecl>();
  syntax::locate(*ctor, stream.here());
  ctor->modifiers = syntax::parseModifiers(stream);
  if (stream.atGroup(GroupKind::Angle)) {
    ctor->typeParams = syntax::parseTypeParams(stream.expectGroup(GroupKind::Angle, "type parameters"));
  }
  ctor->name = stream.expect(TK::Ident, "constructor name").text;
  ctor->params = syntax::parseParameters(stream.expectGroup(GroupKind::Round, "parameter list"));
  if (stream.at(TK::Throws)) {
    stream.advance();
    ctor->throwsList = syntax::parseTypeList(stream);
  }
  ctor->body = OpaqueBodyBuilder::fromGroup(stream.expectGroup(GroupKind::Curly, "constructor body"));
  return ctor;
}

} // namespace nestport::parse

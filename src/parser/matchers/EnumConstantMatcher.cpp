/***
 * Name: nestport::parse::EnumConstantMatcher (impl)
 * Theory of Operation: A constant with a body becomes an AnonymousClassExpr
 *   whose base is the enclosing enum and whose arguments are the constant's.
 */
#include "parser/matchers/EnumConstantMatcher.h"
#include "ast/EnumConstant.h"
#include "parser/BodyDispatcher.h"
#include "parser/OpaqueBodyBuilder.h"
#include "parser/Syntax.h"

namespace nestport::parse {

using TK = lex::TokenKind;
using group::GroupKind;

bool EnumConstantMatcher::recognize(TokenInputStream& peek, const BodyContext& ctx) const {
  if (ctx.classKind != ast::ClassKind::Enum || !ctx.enumConstantSection) { return false; }
  while (peek.at(TK::At)) {
    if (!syntax::skipAnnotation(peek)) { return false; }
  }
  if (!peek.at(TK::Ident)) { return false; }
  peek.advance();
  if (peek.atGroup(GroupKind::Round)) { peek.advance(); }
  if (peek.atGroup(GroupKind::Curly)) { peek.advance(); }
  return !peek.hasNext() || peek.at(TK::Comma) || peek.at(TK::Semi);
}

void EnumConstantMatcher::finish(TokenInputStream& peek) const {
  if (peek.at(TK::Comma)) { peek.advance(); }
}

std::unique_ptr<ast::Node> EnumConstantMatcher::parse(TokenInputStream& stream, const BodyContext& ctx) const {
  auto constant = std::make_unique<ast::EnumConstant>();
  syntax::locate(*constant, stream.here());
  while (stream.at(TK::At)) { constant->annotations.push_back(syntax::parseAnnotation(stream)); }
  const auto& nameTok = stream.expect(TK::Ident, "enum constant name");
  constant->name = nameTok.text;
  if (stream.atGroup(GroupKind::Round)) {
    constant->args = OpaqueBodyBuilder::fromGroup(stream.expectGroup(GroupKind::Round, "constant arguments"));
  }
  if (stream.atGroup(GroupKind::Curly)) {
    const auto& body = stream.expectGroup(GroupKind::Curly, "constant body");
    auto anon = std::make_unique<ast::AnonymousClassExpr>();
    syntax::locate(*anon, nameTok);
    anon->base.name = ctx.className;
    anon->endLine = body.close.line;
    anon->args = std::move(constant->args);
    BodyContext inner;
    inner.classKind = ast::ClassKind::Class;
    BodyDispatcher::dispatchGroup(body, anon->body, inner);
    constant->classBody = std::move(anon);
  }
  if (stream.at(TK::Comma)) { stream.advance(); }
  return constant;
}

} // namespace nestport::parse

/***
 * Name: nestport::parse::FieldMatcher (impl)
 * Purpose: Field declarations with one or more declarators.
 * Theory of Operation:
 *   Decisive landmark: after `Type name` comes '=', ';', ',' or an empty '[]'.
 *   The construct ends after the first top-level ';'; initializers are
 *   opaque spans bounded by top-level ',' or ';'.
 */
#include "parser/matchers/FieldMatcher.h"
#include "ast/FieldDecl.h"
#include "parser/OpaqueBodyBuilder.h"
#include "parser/Syntax.h"

namespace nestport::parse {

using TK = lex::TokenKind;

bool FieldMatcher::recognize(TokenInputStream& peek, const BodyContext&) const {
  syntax::skipModifiers(peek);
  if (!syntax::skipType(peek)) { return false; }
  if (!peek.at(TK::Ident)) { return false; }
  peek.advance();
  if (!peek.hasNext()) { return false; }
  return peek.at(TK::Equal) || peek.at(TK::Semi) || peek.at(TK::Comma) ||
         syntax::isEmptyGroup(peek.current(), group::GroupKind::Square);
}

void FieldMatcher::finish(TokenInputStream& peek) const { (void)syntax::skipPast(peek, TK::Semi); }

std::unique_ptr<ast::Node> FieldMatcher::parse(TokenInputStream& stream, const BodyContext&) const {
  auto field = std::make_unique<ast::FieldDecl>();
  syntax::locate(*field, stream.here());
  field->modifiers = syntax::parseModifiers(stream);
  field->type = syntax::parseType(stream);
  for (;;) {
    ast::FieldDeclarator decl;
    const auto& nameTok = stream.expect(TK::Ident, "field name");
    decl.name = nameTok.text;
    decl.line = nameTok.line;
    decl.col = nameTok.col;
    decl.extraDims = syntax::parseDims(stream);
    if (stream.at(TK::Equal)) {
      stream.advance();
      decl.init = OpaqueBodyBuilder::until(stream, {TK::Comma, TK::Semi});
      if (decl.init->empty()) { stream.fail("expected field initializer"); }
    }
    field->declarators.push_back(std::move(decl));
    if (stream.at(TK::Comma)) {
      stream.advance();
      continue;
    }
    stream.expect(TK::Semi, "';' after field declaration");
    break;
  }
  return field;
}

} // namespace nestport::parse

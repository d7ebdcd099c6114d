/***
 * Name: nestport::parse::parseTypeDeclarationRest (impl)
 * Purpose: Shared tail of class, interface and enum declarations.
 */
#include "parser/ClassDeclParser.h"
#include "parser/BodyDispatcher.h"

namespace nestport::parse {

using TK = lex::TokenKind;

ast::ClassKind parseClassKeyword(TokenInputStream& s) {
  if (s.at(TK::Class)) { s.advance(); return ast::ClassKind::Class; }
  if (s.at(TK::Interface)) { s.advance(); return ast::ClassKind::Interface; }
  if (s.at(TK::Enum)) { s.advance(); return ast::ClassKind::Enum; }
  s.fail("expected 'class', 'interface' or 'enum'");
}

void parseTypeDeclarationRest(TokenInputStream& s, ast::ClassDecl& cls) {
  if (s.atGroup(group::GroupKind::Angle)) {
    cls.typeParams = syntax::parseTypeParams(s.expectGroup(group::GroupKind::Angle, "type parameters"));
  }
  if (s.at(TK::Extends)) {
    s.advance();
    cls.extends = syntax::parseTypeList(s);
  }
  if (s.at(TK::Implements)) {
    s.advance();
    cls.implements = syntax::parseTypeList(s);
  }
  // Sealed hierarchies: the permitted subclasses are not needed for translation
  if (s.atIdent("permits")) {
    s.advance();
    (void)syntax::parseTypeList(s);
  }
  const auto& body = s.expectGroup(group::GroupKind::Curly, "class body");
  BodyContext ctx;
  ctx.className = cls.name;
  ctx.classKind = cls.classKind;
  ctx.enumConstantSection = cls.classKind == ast::ClassKind::Enum;
  BodyDispatcher::dispatchGroup(body, cls.body, ctx);
}

} // namespace nestport::parse

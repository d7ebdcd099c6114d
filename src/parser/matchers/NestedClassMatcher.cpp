/***
 * Name: nestport::parse::NestedClassMatcher (impl)
 * Purpose: Member type declarations; the body is dispatched recursively.
 */
#include "parser/matchers/NestedClassMatcher.h"
#include "ast/NestedClassDecl.h"
#include "parser/ClassDeclParser.h"
#include "parser/Syntax.h"

namespace nestport::parse {

using TK = lex::TokenKind;

bool NestedClassMatcher::recognize(TokenInputStream& peek, const BodyContext&) const {
  syntax::skipModifiers(peek);
  if (!peek.at(TK::Class) && !peek.at(TK::Interface) && !peek.at(TK::Enum)) { return false; }
  peek.advance();
  return peek.at(TK::Ident);
}

void NestedClassMatcher::finish(TokenInputStream& peek) const {
  while (peek.hasNext()) {
    const bool body = peek.atGroup(group::GroupKind::Curly);
    peek.advance();
    if (body) { return; }
  }
}

std::unique_ptr<ast::Node> NestedClassMatcher::parse(TokenInputStream& stream, const BodyContext&) const {
  return parseTypeDeclaration<ast::NestedClassDecl>(stream);
}

} // namespace nestport::parse

/***
 * Name: nestport::parse::parseTypeDeclaration
 * Purpose: Class, interface and enum declarations at file or member level.
 * Inputs:
 *   - TokenInputStream at the first modifier (or keyword) of the declaration
 * Outputs:
 *   - ClassDecl or NestedClassDecl with its body dispatched
 */
#pragma once

#include <memory>
#include "ast/ClassDecl.h"
#include "lexer/TokenKind.h"
#include "parser/Syntax.h"
#include "parser/TokenInputStream.h"

namespace nestport::parse {

// Consumes `class` / `interface` / `enum`
ast::ClassKind parseClassKeyword(TokenInputStream& s);

// Type parameters, extends, implements and the body group
void parseTypeDeclarationRest(TokenInputStream& s, ast::ClassDecl& cls);

template <typename T>
std::unique_ptr<T> parseTypeDeclaration(TokenInputStream& s) {
  const lex::Token first = s.here();
  auto mods = syntax::parseModifiers(s);
  const auto kind = parseClassKeyword(s);
  auto cls = std::make_unique<T>(s.expect(lex::TokenKind::Ident, "type name").text);
  syntax::locate(*cls, first);
  cls->modifiers = std::move(mods);
  cls->classKind = kind;
  parseTypeDeclarationRest(s, *cls);
  return cls;
}

} // namespace nestport::parse

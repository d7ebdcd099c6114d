/***
 * Name: nestport::parse::Parser (impl)
 * Purpose: File-level declarations.
 */
#include "parser/Parser.h"
#include "grouping/Flatten.h"
#include "nestport/exceptions/unrecognized_member_error.h"
#include "parser/ClassDeclParser.h"
#include "parser/Syntax.h"

namespace nestport::parse {

using TK = lex::TokenKind;

void Parser::parsePackage(TokenInputStream& s, ast::File& file) {
  s.expect(TK::Package, "'package'");
  file.packageName = syntax::parseQualifiedName(s);
  s.expect(TK::Semi, "';' after package name");
}

void Parser::parseImport(TokenInputStream& s, ast::File& file) {
  s.expect(TK::Import, "'import'");
  ast::ImportDecl imp;
  if (s.at(TK::Static)) {
    imp.isStatic = true;
    s.advance();
  }
  imp.name = syntax::parseQualifiedName(s);
  if (s.at(TK::Dot)) {
    s.advance();
    if (!s.current().isToken() || s.current().token().text != "*") { s.fail("expected '*' or a name after '.'"); }
    s.advance();
    imp.isWildcard = true;
  }
  s.expect(TK::Semi, "';' after import");
  file.imports.push_back(std::move(imp));
}

bool Parser::atTypeDeclaration(TokenInputStream peek) {
  syntax::skipModifiers(peek);
  return peek.at(TK::Class) || peek.at(TK::Interface) || peek.at(TK::Enum);
}

std::unique_ptr<ast::File> Parser::parseFile() {
  auto file = std::make_unique<ast::File>();
  auto s = TokenInputStream::over(root_);
  syntax::locate(*file, s.here());

  // Package annotations are not translated
  auto probe = s.peekStream();
  syntax::skipModifiers(probe);
  if (probe.at(TK::Package)) {
    s = probe;
    parsePackage(s, *file);
  }
  while (s.at(TK::Import)) { parseImport(s, *file); }

  while (s.hasNext()) {
    if (s.at(TK::Semi)) {
      s.advance();
      continue;
    }
    if (!atTypeDeclaration(s.peekStream())) {
      const auto& element = s.current();
      const auto& tok = element.firstToken();
      throw exceptions::UnrecognizedMemberError("expected a class, interface or enum declaration", tok.file,
                                                tok.line, tok.col, group::describe(element));
    }
    const auto begin = s.position();
    auto cls = parseTypeDeclaration<ast::ClassDecl>(s);
    cls->spanBegin = begin;
    cls->spanEnd = s.position();
    file->classes.push_back(std::move(cls));
  }
  return file;
}

} // namespace nestport::parse

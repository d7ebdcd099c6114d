/***
 * Name: nestport::parse::Parser
 * Purpose: Build the File AST from a grouped token tree.
 * Inputs:
 *   - Root TokenGroup produced by TokenGrouper
 * Outputs:
 *   - File AST: package, imports and top-level type declarations
 * Theory of Operation:
 *   file := [package Name ;] { import [static] Name [. *] ; } { TypeDecl | ; }
 *   Type declarations share their grammar with nested classes; class bodies
 *   are handed to the BodyDispatcher. An element that starts none of these
 *   raises UnrecognizedMemberError at that element.
 */
#pragma once

#include <memory>
#include "ast/File.h"
#include "grouping/TokenGroup.h"
#include "parser/TokenInputStream.h"

namespace nestport::parse {

class Parser {
 public:
  explicit Parser(const group::TokenGroup& root) : root_(root) {}
  std::unique_ptr<ast::File> parseFile();

 private:
  const group::TokenGroup& root_;

  static void parsePackage(TokenInputStream& s, ast::File& file);
  static void parseImport(TokenInputStream& s, ast::File& file);
  static bool atTypeDeclaration(TokenInputStream peek);
};

} // namespace nestport::parse

/***
 * Name: nestport::parse::OpaqueBodyBuilder
 * Purpose: Capture uninterpreted token spans and lift anonymous classes out of them.
 * Inputs:
 *   - A group (method body, argument list) or a stream run up to a stop token
 * Outputs:
 *   - OpaqueBody whose segments alternate verbatim tokens and AnonymousClassExpr
 * Theory of Operation:
 *   Elements are flattened depth first. Wherever `new Type (args) { ... }`
 *   appears, at any depth, the curly group is handed to the BodyDispatcher as
 *   the interior of an anonymous class; the argument group becomes a nested
 *   OpaqueBody. Nothing else inside the span is parsed.
 */
#pragma once

#include <initializer_list>
#include <memory>
#include "ast/OpaqueBody.h"
#include "grouping/TokenGroup.h"
#include "lexer/TokenKind.h"
#include "parser/TokenInputStream.h"

namespace nestport::parse {

class OpaqueBodyBuilder {
 public:
  // Interior of the group; the brackets themselves are excluded
  static std::unique_ptr<ast::OpaqueBody> fromGroup(const group::TokenGroup& grp);
  // Elements from the cursor up to (not including) the first top-level stop token
  static std::unique_ptr<ast::OpaqueBody> until(TokenInputStream& s, std::initializer_list<lex::TokenKind> stops);
};

} // namespace nestport::parse

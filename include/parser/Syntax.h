/***
 * Name: nestport::parse::syntax
 * Purpose: Grammar pieces shared by the construct matchers and the file parser.
 * Inputs:
 *   - TokenInputStream positioned at the piece
 * Outputs:
 *   - skip*: advance past the piece and report whether it was well-formed
 *   - parse*: build the AST fragment, raising ParseError on malformed input
 * Theory of Operation:
 *   The skip* functions are the fail-fast halves used by isMatch/extent on
 *   peek streams; they never throw. The parse* functions walk the same shape
 *   on the real stream. Both only look at token kinds and group kinds.
 */
#pragma once

#include <string>
#include <vector>
#include "ast/Modifiers.h"
#include "ast/Node.h"
#include "ast/Parameter.h"
#include "ast/TypeRef.h"
#include "grouping/TokenGroup.h"
#include "lexer/Token.h"
#include "parser/TokenInputStream.h"

namespace nestport::parse::syntax {

// Recognition (no AST, never throws)
bool skipAnnotation(TokenInputStream& s);
void skipModifiers(TokenInputStream& s);
bool skipType(TokenInputStream& s);
void skipDims(TokenInputStream& s);
// Advance past the next top-level token of `kind`; false when the stream ends first
bool skipPast(TokenInputStream& s, lex::TokenKind kind);
bool isEmptyGroup(const group::Element& element, group::GroupKind kind);

// Construction
std::string parseAnnotation(TokenInputStream& s);
ast::Modifiers parseModifiers(TokenInputStream& s);
ast::TypeRef parseType(TokenInputStream& s);
std::string parseQualifiedName(TokenInputStream& s);
std::vector<ast::TypeRef> parseTypeArgs(const group::TokenGroup& angle);
std::vector<ast::TypeParam> parseTypeParams(const group::TokenGroup& angle);
// Comma separated types up to the first element that cannot continue the list
std::vector<ast::TypeRef> parseTypeList(TokenInputStream& s);
int parseDims(TokenInputStream& s);
std::vector<ast::Parameter> parseParameters(const group::TokenGroup& round);

// Copy provenance of `tok` onto `node`
void locate(ast::Node& node, const lex::Token& tok);

} // namespace nestport::parse::syntax

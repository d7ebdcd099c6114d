/***
 * Name: nestport::parse::MethodMatcher (impl)
 * Purpose: Method declarations, with or without a body.
 * Theory of Operation:
 *   Decisive landmark: the parameter group followed by `throws`, a body group
 *   or ';'. The construct ends after the body group or the ';'.
 */
#include "parser/matchers/MethodMatcher.h"
#include "ast/MethodDecl.h"
#include "parser/OpaqueBodyBuilder.h"
#include "parser/Syntax.h"

namespace nestport::parse {

using TK = lex::TokenKind;
using group::GroupKind;

bool MethodMatcher::recognize(TokenInputStream& peek, const BodyContext&) const {
  syntax::skipModifiers(peek);
  if (peek.atGroup(GroupKind::Angle)) { peek.advance(); }
  // Annotations may also follow the type parameters
  syntax::skipModifiers(peek);
  if (peek.at(TK::Void)) {
    peek.advance();
  } else if (!syntax::skipType(peek)) {
    return false;
  }
  if (!peek.at(TK::Ident)) { return false; }
  peek.advance();
  if (!peek.atGroup(GroupKind::Round)) { return false; }
  peek.advance();
  syntax::skipDims(peek);
  return peek.at(TK::Throws) || peek.atGroup(GroupKind::Curly) || peek.at(TK::Semi);
}

void MethodMatcher::finish(TokenInputStream& peek) const {
  while (peek.hasNext()) {
    const bool last = peek.atGroup(GroupKind::Curly) || peek.at(TK::Semi);
    peek.advance();
    if (last) { return; }
  }
}

std::unique_ptr<ast::Node> MethodMatcher::parse(TokenInputStream& stream, const BodyContext& ctx) const {
  auto method = std::make_unique<ast::MethodDecl>();
  syntax::locate(*method, stream.here());
  method->modifiers = syntax::parseModifiers(stream);
  if (stream.atGroup(GroupKind::Angle)) {
    method->typeParams = syntax::parseTypeParams(stream.expectGroup(GroupKind::Angle, "type parameters"));
    auto more = syntax::parseModifiers(stream);
    for (auto& ann : more.annotations) { method->modifiers.annotations.push_back(std::move(ann)); }
  }
  method->returnType = syntax::parseType(stream);
  method->name = stream.expect(TK::Ident, "method name").text;
  method->params = syntax::parseParameters(stream.expectGroup(GroupKind::Round, "parameter list"));
  method->returnType.arrayDims += syntax::parseDims(stream);
  if (stream.at(TK::Throws)) {
    stream.advance();
    method->throwsList = syntax::parseTypeList(stream);
  }
  if (stream.atGroup(GroupKind::Curly)) {
    method->body = OpaqueBodyBuilder::fromGroup(stream.expectGroup(GroupKind::Curly, "method body"));
  } else {
    stream.expect(TK::Semi, "method body or ';'");
    // Interface methods without a body are implicitly abstract
    if (ctx.classKind == ast::ClassKind::Interface && !method->modifiers.isStatic() &&
        !method->modifiers.isAbstract()) {
      method->modifiers.keywords.emplace_back("abstract");
    }
  }
  return method;
}

} // namespace nestport::parse

/***
 * Name: nestport::parse::syntax (impl)
 * Purpose: Modifier, type, type-parameter and parameter grammar.
 */
#include "parser/Syntax.h"
#include "grouping/Flatten.h"

namespace nestport::parse::syntax {

using TK = lex::TokenKind;
using group::GroupKind;

bool isEmptyGroup(const group::Element& element, const GroupKind kind) {
  if (!element.isGroup(kind)) { return false; }
  for (const auto& child : element.group().children) {
    if (!child.is(TK::Comment)) { return false; }
  }
  return true;
}

bool skipAnnotation(TokenInputStream& s) {
  if (!s.at(TK::At)) { return false; }
  s.advance();
  if (!s.at(TK::Ident)) { return false; } // also rejects @interface
  s.advance();
  while (s.at(TK::Dot)) {
    s.advance();
    if (!s.at(TK::Ident)) { return false; }
    s.advance();
  }
  if (s.atGroup(GroupKind::Round)) { s.advance(); }
  return true;
}

void skipModifiers(TokenInputStream& s) {
  while (s.hasNext()) {
    if (s.at(TK::At)) {
      auto probe = s.peekStream();
      if (!skipAnnotation(probe)) { return; }
      s = probe;
      continue;
    }
    if (s.current().isToken() && lex::isModifier(s.current().token().kind)) {
      s.advance();
      continue;
    }
    return;
  }
}

void skipDims(TokenInputStream& s) {
  while (s.hasNext() && isEmptyGroup(s.current(), GroupKind::Square)) { s.advance(); }
}

bool skipType(TokenInputStream& s) {
  if (s.at(TK::PrimitiveType)) {
    s.advance();
    skipDims(s);
    return true;
  }
  if (!s.at(TK::Ident)) { return false; }
  s.advance();
  if (s.atGroup(GroupKind::Angle)) { s.advance(); }
  while (s.at(TK::Dot)) {
    s.advance();
    if (!s.at(TK::Ident)) { return false; }
    s.advance();
    if (s.atGroup(GroupKind::Angle)) { s.advance(); }
  }
  skipDims(s);
  return true;
}

bool skipPast(TokenInputStream& s, const TK kind) {
  while (s.hasNext()) {
    const bool hit = s.at(kind);
    s.advance();
    if (hit) { return true; }
  }
  return false;
}

std::string parseAnnotation(TokenInputStream& s) {
  std::string out = s.expect(TK::At, "'@'").text;
  out += s.expect(TK::Ident, "annotation name").text;
  while (s.at(TK::Dot)) {
    s.advance();
    out += '.';
    out += s.expect(TK::Ident, "annotation name").text;
  }
  if (s.atGroup(GroupKind::Round)) {
    const auto& args = s.current().group();
    out += '(';
    bool first = true;
    for (const auto& child : args.children) {
      std::vector<lex::Token> toks;
      group::appendFlattened(child, toks);
      for (const auto& tok : toks) {
        if (tok.kind == TK::Comment) { continue; }
        if (!first && tok.spaceBefore) { out += ' '; }
        out += tok.text;
        first = false;
      }
    }
    out += ')';
    s.advance();
  }
  return out;
}

ast::Modifiers parseModifiers(TokenInputStream& s) {
  ast::Modifiers mods;
  while (s.hasNext()) {
    if (s.at(TK::At)) {
      // '@' not followed by a name (e.g. @interface) ends the run
      const auto* next = s.peek(1);
      if (next == nullptr || !next->is(TK::Ident)) { break; }
      mods.annotations.push_back(parseAnnotation(s));
      continue;
    }
    if (!s.current().isToken() || !lex::isModifier(s.current().token().kind)) { break; }
    const auto& tok = s.current().token();
    switch (tok.kind) {
      case TK::Public: mods.access = ast::Access::Public; break;
      case TK::Protected: mods.access = ast::Access::Protected; break;
      case TK::Private: mods.access = ast::Access::Private; break;
      default: break;
    }
    mods.keywords.push_back(tok.text);
    s.advance();
  }
  return mods;
}

std::string parseQualifiedName(TokenInputStream& s) {
  std::string name = s.expect(TK::Ident, "identifier").text;
  while (s.at(TK::Dot)) {
    const auto* next = s.peek(1);
    if (next == nullptr || !next->is(TK::Ident)) { break; }
    s.advance();
    name += '.';
    name += s.current().token().text;
    s.advance();
  }
  return name;
}

int parseDims(TokenInputStream& s) {
  int dims = 0;
  while (s.hasNext() && isEmptyGroup(s.current(), GroupKind::Square)) {
    ++dims;
    s.advance();
  }
  return dims;
}

ast::TypeRef parseType(TokenInputStream& s) {
  ast::TypeRef type;
  // Type-use annotations carry no meaning for the translation
  while (s.at(TK::At)) { (void)parseAnnotation(s); }
  const auto& first = s.here();
  type.file = first.file;
  type.line = first.line;
  type.col = first.col;
  if (s.at(TK::PrimitiveType) || s.at(TK::Void)) {
    type.name = s.current().token().text;
    type.primitive = true;
    s.advance();
    type.arrayDims = parseDims(s);
    return type;
  }
  type.name = s.expect(TK::Ident, "type name").text;
  if (s.atGroup(GroupKind::Angle)) { type.args = parseTypeArgs(s.expectGroup(GroupKind::Angle, "type arguments")); }
  while (s.at(TK::Dot)) {
    s.advance();
    type.name += '.';
    type.name += s.expect(TK::Ident, "type name").text;
    if (s.atGroup(GroupKind::Angle)) {
      type.args = parseTypeArgs(s.expectGroup(GroupKind::Angle, "type arguments"));
    }
  }
  type.arrayDims = parseDims(s);
  return type;
}

std::vector<ast::TypeRef> parseTypeArgs(const group::TokenGroup& angle) {
  std::vector<ast::TypeRef> args;
  auto s = TokenInputStream::over(angle);
  while (s.hasNext()) {
    while (s.at(TK::At)) { (void)parseAnnotation(s); }
    if (s.at(TK::Question)) {
      ast::TypeRef wild;
      wild.file = s.here().file;
      wild.line = s.here().line;
      wild.col = s.here().col;
      s.advance();
      wild.wildcard = ast::TypeRef::Wildcard::Unbounded;
      if (s.at(TK::Extends) || s.at(TK::Super)) {
        wild.wildcard = s.at(TK::Extends) ? ast::TypeRef::Wildcard::Extends : ast::TypeRef::Wildcard::Super;
        s.advance();
        wild.args.push_back(parseType(s));
      }
      args.push_back(std::move(wild));
    } else {
      args.push_back(parseType(s));
    }
    if (!s.hasNext()) { break; }
    s.expect(TK::Comma, "',' or '>' in type arguments");
  }
  return args;
}

std::vector<ast::TypeParam> parseTypeParams(const group::TokenGroup& angle) {
  std::vector<ast::TypeParam> params;
  auto s = TokenInputStream::over(angle);
  while (s.hasNext()) {
    while (s.at(TK::At)) { (void)parseAnnotation(s); }
    ast::TypeParam param;
    param.name = s.expect(TK::Ident, "type parameter name").text;
    if (s.at(TK::Extends)) {
      s.advance();
      param.bounds.push_back(parseType(s));
      while (s.at(TK::Amp)) {
        s.advance();
        param.bounds.push_back(parseType(s));
      }
    }
    params.push_back(std::move(param));
    if (!s.hasNext()) { break; }
    s.expect(TK::Comma, "',' or '>' in type parameters");
  }
  return params;
}

std::vector<ast::TypeRef> parseTypeList(TokenInputStream& s) {
  std::vector<ast::TypeRef> out;
  out.push_back(parseType(s));
  while (s.at(TK::Comma)) {
    s.advance();
    out.push_back(parseType(s));
  }
  return out;
}

std::vector<ast::Parameter> parseParameters(const group::TokenGroup& round) {
  std::vector<ast::Parameter> params;
  auto s = TokenInputStream::over(round);
  while (s.hasNext()) {
    ast::Parameter param;
    locate(param, s.here());
    param.modifiers = parseModifiers(s);
    param.type = parseType(s);
    if (s.at(TK::Ellipsis)) {
      s.advance();
      param.isVarArgs = true;
    }
    // Receiver parameter: `Outer this`
    if (s.current().isToken() && s.current().token().text == "this") {
      s.advance();
      if (s.hasNext()) { s.expect(TK::Comma, "',' between parameters"); }
      continue;
    }
    param.name = s.expect(TK::Ident, "parameter name").text;
    param.type.arrayDims += parseDims(s);
    params.push_back(std::move(param));
    if (!s.hasNext()) { break; }
    s.expect(TK::Comma, "',' between parameters");
  }
  return params;
}

void locate(ast::Node& node, const lex::Token& tok) {
  node.file = tok.file;
  node.line = tok.line;
  node.col = tok.col;
}

} // namespace nestport::parse::syntax

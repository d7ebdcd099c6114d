/***
 * Name: nestport::parse::OpaqueBodyBuilder (impl)
 * Purpose: Depth-first flattening with anonymous class detection.
 */
#include "parser/OpaqueBodyBuilder.h"
#include "ast/AnonymousClassExpr.h"
#include "parser/BodyDispatcher.h"
#include "parser/Syntax.h"
#include <algorithm>
#include <vector>

namespace nestport::parse {

using TK = lex::TokenKind;
using group::GroupKind;
using Elements = std::vector<const group::Element*>;

namespace {

class SegmentWriter {
 public:
  explicit SegmentWriter(ast::OpaqueBody& body) : body_(body) {}

  void token(const lex::Token& tok) { current_.tokens.push_back(tok); }

  void anonymous(std::unique_ptr<ast::AnonymousClassExpr> anon) {
    current_.anonymous = std::move(anon);
    body_.segments.push_back(std::move(current_));
    current_ = ast::OpaqueSegment{};
  }

  void close() {
    if (!current_.tokens.empty()) { body_.segments.push_back(std::move(current_)); }
  }

 private:
  ast::OpaqueBody& body_;
  ast::OpaqueSegment current_;
};

Elements childrenOf(const group::TokenGroup& grp) {
  Elements out;
  out.reserve(grp.children.size());
  for (const auto& child : grp.children) { out.push_back(&child); }
  return out;
}

std::size_t skipComments(const Elements& elems, std::size_t idx) {
  while (idx < elems.size() && elems[idx]->is(TK::Comment)) { ++idx; }
  return idx;
}

// `new Type (args) { body }` starting at elems[at]; on success `next` is the index after the body
std::unique_ptr<ast::AnonymousClassExpr> tryAnonymous(const Elements& elems, const std::size_t at, std::size_t& next) {
  const auto n = elems.size();
  std::size_t idx = skipComments(elems, at + 1);
  if (idx >= n || !elems[idx]->is(TK::Ident)) { return nullptr; }
  ast::TypeRef base;
  base.name = elems[idx]->token().text;
  base.file = elems[idx]->token().file;
  base.line = elems[idx]->token().line;
  base.col = elems[idx]->token().col;
  idx = skipComments(elems, idx + 1);
  const group::TokenGroup* typeArgs = nullptr;
  if (idx < n && elems[idx]->isGroup(GroupKind::Angle)) {
    typeArgs = &elems[idx]->group();
    idx = skipComments(elems, idx + 1);
  }
  while (idx < n && elems[idx]->is(TK::Dot)) {
    const auto seg = skipComments(elems, idx + 1);
    if (seg >= n || !elems[seg]->is(TK::Ident)) { return nullptr; }
    base.name += '.';
    base.name += elems[seg]->token().text;
    idx = skipComments(elems, seg + 1);
    if (idx < n && elems[idx]->isGroup(GroupKind::Angle)) {
      typeArgs = &elems[idx]->group();
      idx = skipComments(elems, idx + 1);
    }
  }
  if (idx >= n || !elems[idx]->isGroup(GroupKind::Round)) { return nullptr; }
  const auto& args = elems[idx]->group();
  idx = skipComments(elems, idx + 1);
  if (idx >= n || !elems[idx]->isGroup(GroupKind::Curly)) { return nullptr; }
  const auto& body = elems[idx]->group();

  auto anon = std::make_unique<ast::AnonymousClassExpr>();
  syntax::locate(*anon, elems[at]->token());
  if (typeArgs != nullptr) { base.args = syntax::parseTypeArgs(*typeArgs); }
  anon->base = std::move(base);
  anon->args = OpaqueBodyBuilder::fromGroup(args);
  anon->endLine = body.close.line;
  BodyDispatcher::dispatchGroup(body, anon->body, BodyContext{});
  next = idx + 1;
  return anon;
}

void walk(const Elements& elems, SegmentWriter& out) {
  for (std::size_t idx = 0; idx < elems.size(); ++idx) {
    const auto& element = *elems[idx];
    if (element.is(TK::New)) {
      std::size_t next = idx;
      if (auto anon = tryAnonymous(elems, idx, next)) {
        out.anonymous(std::move(anon));
        idx = next - 1;
        continue;
      }
    }
    if (element.isGroup()) {
      const auto& grp = element.group();
      out.token(grp.open);
      walk(childrenOf(grp), out);
      out.token(grp.close);
      continue;
    }
    out.token(element.token());
  }
}

std::unique_ptr<ast::OpaqueBody> build(const Elements& elems) {
  auto body = std::make_unique<ast::OpaqueBody>();
  if (!elems.empty()) { syntax::locate(*body, elems.front()->firstToken()); }
  SegmentWriter out{*body};
  walk(elems, out);
  out.close();
  return body;
}

} // namespace

std::unique_ptr<ast::OpaqueBody> OpaqueBodyBuilder::fromGroup(const group::TokenGroup& grp) {
  auto body = build(childrenOf(grp));
  if (body->line == 0) { syntax::locate(*body, grp.close); }
  return body;
}

std::unique_ptr<ast::OpaqueBody> OpaqueBodyBuilder::until(TokenInputStream& s, const std::initializer_list<TK> stops) {
  Elements elems;
  while (s.hasNext()) {
    const auto& element = s.current();
    const bool stop = std::any_of(stops.begin(), stops.end(), [&](const TK kind) { return element.is(kind); });
    if (stop) { break; }
    elems.push_back(&element);
    s.advance();
  }
  return build(elems);
}

} // namespace nestport::parse

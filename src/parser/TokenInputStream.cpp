/***
 * Name: nestport::parse::TokenInputStream (impl)
 * Purpose: Trivia-skipping element cursor.
 */
#include "parser/TokenInputStream.h"
#include "nestport/exceptions/parse_error.h"

namespace nestport::parse {

using TK = lex::TokenKind;

namespace {
bool isTrivia(const group::Element& element) { return element.is(TK::Comment); }
} // namespace

TokenInputStream::TokenInputStream(const std::vector<group::Element>& elements, const lex::Token& endToken)
    : elements_(&elements), pos_(0), end_(elements.size()), endToken_(&endToken) {
  skipTrivia();
}

TokenInputStream::TokenInputStream(const std::vector<group::Element>& elements, const std::size_t begin,
                                   const std::size_t end, const lex::Token& endToken)
    : elements_(&elements), pos_(begin), end_(end < elements.size() ? end : elements.size()), endToken_(&endToken) {
  skipTrivia();
}

TokenInputStream TokenInputStream::over(const group::TokenGroup& grp) {
  return TokenInputStream{grp.children, grp.close};
}

void TokenInputStream::skipTrivia() {
  while (pos_ < end_ && isTrivia((*elements_)[pos_])) { ++pos_; }
}

const group::Element& TokenInputStream::current() const {
  if (!hasNext()) { fail("unexpected end of input"); }
  return (*elements_)[pos_];
}

const group::Element* TokenInputStream::peek(const std::size_t k) const {
  std::size_t seen = 0;
  for (std::size_t idx = pos_; idx < end_; ++idx) {
    const auto& element = (*elements_)[idx];
    if (isTrivia(element)) { continue; }
    if (seen == k) { return &element; }
    ++seen;
  }
  return nullptr;
}

void TokenInputStream::advance() {
  if (!hasNext()) { fail("unexpected end of input"); }
  ++pos_;
  skipTrivia();
}

TokenInputStream TokenInputStream::subStreamForCurrentGroup() const {
  const auto& element = current();
  if (!element.isGroup()) { fail("expected a bracketed group"); }
  return over(element.group());
}

bool TokenInputStream::atIdent(const std::string& text) const {
  return at(TK::Ident) && current().token().text == text;
}

const lex::Token& TokenInputStream::expect(const TK kind, const char* what) {
  if (!at(kind)) { fail(std::string("expected ") + what); }
  const auto& tok = current().token();
  advance();
  return tok;
}

const group::TokenGroup& TokenInputStream::expectGroup(const group::GroupKind kind, const char* what) {
  if (!atGroup(kind)) { fail(std::string("expected ") + what); }
  const auto& grp = current().group();
  advance();
  return grp;
}

const lex::Token& TokenInputStream::here() const {
  return hasNext() ? (*elements_)[pos_].firstToken() : *endToken_;
}

void TokenInputStream::fail(const std::string& detail) const {
  const auto& tok = here();
  throw exceptions::ParseError(detail, tok.file, tok.line, tok.col, tok.text);
}

} // namespace nestport::parse

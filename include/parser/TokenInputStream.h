/***
 * Name: nestport::parse::TokenInputStream
 * Purpose: Cursor over a sequence of grouped elements with lookahead.
 * Inputs:
 *   - A TokenGroup (or any element vector) that outlives the stream
 * Outputs:
 *   - Element access, independent peek streams, O(1) sub-streams over groups
 * Theory of Operation:
 *   The stream is a small value type {elements, pos, end, endToken}; copying it
 *   yields a peek stream whose advancement never affects the original. Comment
 *   tokens are trivia: the cursor always rests on a non-comment element or at
 *   the end, while position() still indexes the backing sequence. Reading past
 *   the end raises ParseError located at the closing token of the sequence.
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "grouping/Element.h"
#include "grouping/TokenGroup.h"
#include "lexer/Token.h"

namespace nestport::parse {

class TokenInputStream {
 public:
  TokenInputStream(const std::vector<group::Element>& elements, const lex::Token& endToken);
  // View of elements[begin, end)
  TokenInputStream(const std::vector<group::Element>& elements, std::size_t begin, std::size_t end,
                   const lex::Token& endToken);

  // Stream over a group's children; end-of-stream errors point at the group's close token
  static TokenInputStream over(const group::TokenGroup& grp);

  bool hasNext() const { return pos_ < end_; }
  const group::Element& current() const;
  // k-th non-comment element after the cursor (0 == current); nullptr past the end
  const group::Element* peek(std::size_t k = 0) const;
  void advance();

  TokenInputStream peekStream() const { return *this; }
  // Precondition: current() is a group
  TokenInputStream subStreamForCurrentGroup() const;

  std::size_t position() const { return pos_; }
  std::size_t end() const { return end_; }

  // Convenience predicates over current()
  bool at(lex::TokenKind kind) const { return hasNext() && current().is(kind); }
  bool atGroup(group::GroupKind kind) const { return hasNext() && current().isGroup(kind); }
  bool atIdent(const std::string& text) const;

  // Consume current() when it matches, otherwise raise ParseError mentioning `what`
  const lex::Token& expect(lex::TokenKind kind, const char* what);
  const group::TokenGroup& expectGroup(group::GroupKind kind, const char* what);

  // Location of current(), or the end token when exhausted
  const lex::Token& here() const;

  [[noreturn]] void fail(const std::string& detail) const;

 private:
  void skipTrivia();

  const std::vector<group::Element>* elements_;
  std::size_t pos_{0};
  std::size_t end_{0};
  const lex::Token* endToken_;
};

} // namespace nestport::parse

/***
 * Name: nestport::emit::BodyWriter
 * Purpose: Re-emit opaque token spans as C++ text.
 * Inputs:
 *   - OpaqueBody (or a token run) and the indentation to apply
 * Outputs:
 *   - Source text preserving line breaks, relative indentation and token
 *     adjacency; every anonymous class expression is replaced by
 *     `new <Emitted>(<args>)`
 * Theory of Operation:
 *   A token on a later source line than the previous token starts a new
 *   output line indented by the base indentation plus its column offset from
 *   the leftmost line-starting token of the span. Otherwise a single space is
 *   written when the token was preceded by whitespace. A line comment always
 *   ends the output line.
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "ast/OpaqueBody.h"
#include "emitter/LoweringPlan.h"
#include "lexer/Token.h"

namespace nestport::emit {

class BodyWriter {
 public:
  BodyWriter(const LoweringPlan& plan, int indentWidth) : plan_(plan), indentWidth_(indentWidth) {}

  // Statements of a block body, each output line indented by `depth` levels; no braces.
  // The first `skip` tokens of the first segment are left out.
  std::string block(const ast::OpaqueBody& body, int depth, std::size_t skip = 0) const;
  // Inline expression; continuation lines are indented by `depth` levels
  std::string expression(const ast::OpaqueBody& body, int depth) const;
  std::string expression(const std::vector<lex::Token>& tokens, int depth) const;

  std::string indent(int depth) const { return std::string(static_cast<std::size_t>(depth * indentWidth_), ' '); }

 private:
  const LoweringPlan& plan_;
  int indentWidth_;
};

} // namespace nestport::emit

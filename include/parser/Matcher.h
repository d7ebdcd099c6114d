/***
 * Name: nestport::parse::Matcher
 * Purpose: Recognizer/parser pair for one kind of class member.
 * Inputs:
 *   - TokenInputStream positioned at a member boundary
 *   - BodyContext describing the enclosing class
 * Outputs:
 *   - isMatch: fail-fast recognition on a peek stream
 *   - extent: position just past the construct, found by a structural scan
 *   - parse: AST node; consumes exactly the construct on the real stream
 * Theory of Operation:
 *   recognize() walks a peek stream up to the construct's decisive landmark
 *   (for a field, the token after its name). finish() continues from there
 *   through the construct's terminator. isMatch and extent are the two
 *   non-virtual compositions of these; parse() is written independently so
 *   the dispatcher can check that both agree on where the construct ends.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include "ast/ClassDecl.h"
#include "ast/Node.h"
#include "parser/TokenInputStream.h"

namespace nestport::parse {

struct BodyContext {
  std::string className{};  // empty for anonymous classes
  ast::ClassKind classKind{ast::ClassKind::Class};
  bool enumConstantSection{false};
};

class Matcher {
 public:
  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

  Matcher() = default;
  virtual ~Matcher() = default;
  Matcher(const Matcher&) = delete;
  Matcher& operator=(const Matcher&) = delete;
  Matcher(Matcher&&) = delete;
  Matcher& operator=(Matcher&&) = delete;

  virtual const char* name() const = 0;

  bool isMatch(TokenInputStream peek, const BodyContext& ctx) const { return recognize(peek, ctx); }

  // End position of the construct, or npos when it does not match here
  std::size_t extent(TokenInputStream peek, const BodyContext& ctx) const {
    if (!recognize(peek, ctx)) { return npos; }
    finish(peek);
    return peek.position();
  }

  virtual std::unique_ptr<ast::Node> parse(TokenInputStream& stream, const BodyContext& ctx) const = 0;

 protected:
  virtual bool recognize(TokenInputStream& peek, const BodyContext& ctx) const = 0;
  virtual void finish(TokenInputStream& peek) const = 0;
};

} // namespace nestport::parse

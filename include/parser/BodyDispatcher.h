/***
 * Name: nestport::parse::BodyDispatcher
 * Purpose: Turn the interior of a class body into member AST nodes.
 * Inputs:
 *   - TokenInputStream over the children of a class body's curly group
 *   - BodyContext of the owning class
 * Outputs:
 *   - Members appended to the owning ClassBody in source order
 * Theory of Operation:
 *   A state machine Scanning -> Matched -> ... -> Exhausted. At each member
 *   boundary the matchers are tried in priority order against a peek stream;
 *   the first that recognizes the construct parses it on the real stream. The
 *   position reached by parse is compared with the matcher's extent; a
 *   difference raises MatcherConsumptionMismatchError. When no matcher
 *   recognizes the element at the cursor, UnrecognizedMemberError is raised
 *   carrying that element. Stray ';' are skipped. In an enum body only the
 *   enum constant matcher is consulted until the constant list ends.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/ClassBody.h"
#include "grouping/TokenGroup.h"
#include "parser/Matcher.h"
#include "parser/TokenInputStream.h"

namespace nestport::parse {

class BodyDispatcher {
 public:
  static void dispatch(TokenInputStream& stream, ast::ClassBody& body, BodyContext ctx);
  // Same loop over a caller-supplied matcher list, tried in the order given
  static void dispatch(TokenInputStream& stream, ast::ClassBody& body, BodyContext ctx,
                       const std::vector<std::unique_ptr<Matcher>>& matchers);
  static void dispatchGroup(const group::TokenGroup& curly, ast::ClassBody& body, BodyContext ctx);
};

} // namespace nestport::parse

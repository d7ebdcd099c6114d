/***
 * Name: nestport::parse::BodyDispatcher (impl)
 * Purpose: Member dispatch loop with consumption checking.
 */
#include "parser/BodyDispatcher.h"
#include "grouping/Flatten.h"
#include "nestport/exceptions/matcher_consumption_mismatch_error.h"
#include "nestport/exceptions/unrecognized_member_error.h"
#include "parser/MatcherSet.h"
#include <string>
#include <utility>

namespace nestport::parse {

using TK = lex::TokenKind;

namespace {

enum class DispatchState { Scanning, Matched, Exhausted };

const Matcher* select(const TokenInputStream& stream, BodyContext& ctx,
                      const std::vector<std::unique_ptr<Matcher>>& matchers) {
  if (ctx.enumConstantSection) {
    const auto& constant = enumConstantMatcher();
    if (constant.isMatch(stream.peekStream(), ctx)) { return &constant; }
    // Anything else ends the constant list
    ctx.enumConstantSection = false;
  }
  for (const auto& matcher : matchers) {
    if (matcher->isMatch(stream.peekStream(), ctx)) { return matcher.get(); }
  }
  return nullptr;
}

std::string where(const BodyContext& ctx) {
  return ctx.className.empty() ? std::string("anonymous class body") : "body of '" + ctx.className + "'";
}

} // namespace

void BodyDispatcher::dispatch(TokenInputStream& stream, ast::ClassBody& body, BodyContext ctx) {
  dispatch(stream, body, std::move(ctx), memberMatchers());
}

void BodyDispatcher::dispatch(TokenInputStream& stream, ast::ClassBody& body, BodyContext ctx,
                              const std::vector<std::unique_ptr<Matcher>>& matchers) {
  auto state = DispatchState::Scanning;
  while (state != DispatchState::Exhausted) {
    if (!stream.hasNext()) {
      state = DispatchState::Exhausted;
      continue;
    }
    // Empty declaration; in an enum it also closes the constant list
    if (stream.at(TK::Semi)) {
      ctx.enumConstantSection = false;
      stream.advance();
      state = DispatchState::Scanning;
      continue;
    }

    const Matcher* matcher = select(stream, ctx, matchers);
    if (matcher == nullptr) {
      const auto& element = stream.current();
      const auto& tok = element.firstToken();
      throw exceptions::UnrecognizedMemberError("no member declaration matches in " + where(ctx), tok.file, tok.line,
                                                tok.col, group::describe(element));
    }

    const lex::Token first = stream.here();
    const auto begin = stream.position();
    const auto expected = matcher->extent(stream.peekStream(), ctx);
    auto node = matcher->parse(stream, ctx);
    const auto consumed = stream.position();
    if (consumed != expected) {
      throw exceptions::MatcherConsumptionMismatchError(
          std::string("matcher '") + matcher->name() + "' consumed through element " + std::to_string(consumed) +
              " but its extent ends at element " + std::to_string(expected),
          first.file, first.line, first.col, first.text);
    }
    node->spanBegin = begin;
    node->spanEnd = consumed;
    if (node->kind != ast::NodeKind::EnumConstant) { ctx.enumConstantSection = false; }
    body.add(std::move(node));
    state = DispatchState::Matched;
  }
}

void BodyDispatcher::dispatchGroup(const group::TokenGroup& curly, ast::ClassBody& body, BodyContext ctx) {
  auto stream = TokenInputStream::over(curly);
  dispatch(stream, body, std::move(ctx));
}

} // namespace nestport::parse

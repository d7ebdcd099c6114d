/***
 * Name: nestport::group::TokenGrouper (impl)
 * Purpose: Bracket grouping with an explicit stack of open groups.
 */
#include "grouping/TokenGrouper.h"
#include "nestport/exceptions/unbalanced_bracket_error.h"
#include <memory>
#include <string>
#include <utility>

namespace nestport::group {

using TK = lex::TokenKind;

namespace {

struct Frame {
  std::unique_ptr<TokenGroup> group;
  std::size_t angleClose{0}; // index of the closing '>' for Angle frames
};

GroupKind openKind(const TK kind) {
  switch (kind) {
    case TK::LBrace: return GroupKind::Curly;
    case TK::LParen: return GroupKind::Round;
    case TK::LBracket: return GroupKind::Square;
    default: return GroupKind::Root;
  }
}

GroupKind closeKind(const TK kind) {
  switch (kind) {
    case TK::RBrace: return GroupKind::Curly;
    case TK::RParen: return GroupKind::Round;
    case TK::RBracket: return GroupKind::Square;
    default: return GroupKind::Root;
  }
}

std::string location(const lex::Token& tok) {
  return std::to_string(tok.line) + ":" + std::to_string(tok.col);
}

[[noreturn]] void failAt(const lex::Token& tok, const std::string& detail) {
  throw exceptions::UnbalancedBracketError(detail, tok.file, tok.line, tok.col, tok.text);
}

} // namespace

std::size_t TokenGrouper::matchAngle(const std::vector<lex::Token>& tokens, const std::size_t open) {
  int depth = 0;
  for (std::size_t idx = open; idx < tokens.size(); ++idx) {
    switch (tokens[idx].kind) {
      case TK::Lt: ++depth; break;
      case TK::Gt:
        if (--depth == 0) { return idx; }
        break;
      case TK::LBracket:
        // Only empty dimension pairs may appear inside type arguments
        if (idx + 1 >= tokens.size() || tokens[idx + 1].kind != TK::RBracket) { return std::string::npos; }
        ++idx;
        break;
      case TK::Ident:
      case TK::PrimitiveType:
      case TK::Dot:
      case TK::Comma:
      case TK::Question:
      case TK::Amp:
      case TK::Extends:
      case TK::Super:
      case TK::At:
      case TK::Comment:
        break;
      default:
        return std::string::npos;
    }
  }
  return std::string::npos;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
TokenGroup TokenGrouper::group(const std::vector<lex::Token>& tokens) {
  std::vector<Frame> stack;
  stack.push_back(Frame{std::make_unique<TokenGroup>(), 0});

  for (std::size_t idx = 0; idx < tokens.size(); ++idx) {
    const auto& tok = tokens[idx];
    if (tok.kind == TK::End) {
      // Root keeps the End token so end-of-input diagnostics have a location
      stack.front().group->close = tok;
      break;
    }

    if (const auto kind = openKind(tok.kind); kind != GroupKind::Root) {
      auto grp = std::make_unique<TokenGroup>();
      grp->kind = kind;
      grp->open = tok;
      stack.push_back(Frame{std::move(grp), 0});
      continue;
    }
    if (tok.kind == TK::Lt) {
      if (const auto close = matchAngle(tokens, idx); close != std::string::npos) {
        auto grp = std::make_unique<TokenGroup>();
        grp->kind = GroupKind::Angle;
        grp->open = tok;
        stack.push_back(Frame{std::move(grp), close});
        continue;
      }
    }
    const bool closesAngle = tok.kind == TK::Gt && stack.back().group->kind == GroupKind::Angle &&
                             stack.back().angleClose == idx;
    const auto kind = closeKind(tok.kind);
    if (closesAngle || kind != GroupKind::Root) {
      auto& top = stack.back();
      if (!closesAngle) {
        if (top.group->kind == GroupKind::Root) {
          failAt(tok, "unmatched closing bracket");
        }
        if (top.group->kind != kind) {
          failAt(tok, std::string("closing bracket does not match '") + top.group->open.text + "' opened at " +
                          location(top.group->open));
        }
      }
      auto done = std::move(top.group);
      done->close = tok;
      stack.pop_back();
      stack.back().group->children.emplace_back(std::move(done));
      continue;
    }
    stack.back().group->children.emplace_back(tok);
  }

  if (stack.size() > 1) {
    failAt(stack.back().group->open, "unclosed bracket at end of input");
  }
  return std::move(*stack.back().group);
}

} // namespace nestport::group

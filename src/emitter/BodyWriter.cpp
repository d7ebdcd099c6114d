/***
 * Name: nestport::emit::BodyWriter (impl)
 */
#include "emitter/BodyWriter.h"
#include "ast/AnonymousClassExpr.h"
#include "nestport/exceptions/emission_error.h"
#include <algorithm>
#include <cctype>
#include <climits>
#include <sstream>
#include <utility>

namespace nestport::emit {

using TK = lex::TokenKind;

namespace {

int endLine(const lex::Token& tok) {
  return tok.line + static_cast<int>(std::count(tok.text.begin(), tok.text.end(), '\n'));
}

bool isLineComment(const lex::Token& tok) { return tok.kind == TK::Comment && tok.text.rfind("//", 0) == 0; }

// Leftmost column among tokens that begin a source line (the first token counts only in block mode)
int baseColumn(const std::vector<const lex::Token*>& toks, const bool countFirst) {
  int base = INT_MAX;
  int prevEnd = 0;
  for (std::size_t idx = 0; idx < toks.size(); ++idx) {
    const auto& tok = *toks[idx];
    const bool startsLine = idx == 0 ? countFirst : tok.line > prevEnd;
    if (startsLine) { base = std::min(base, tok.col); }
    prevEnd = endLine(tok);
  }
  return base == INT_MAX ? 1 : base;
}

class TokenPrinter {
 public:
  TokenPrinter(const LoweringPlan& plan, std::string indent, const bool blockMode, const int baseCol)
      : plan_(plan), indent_(std::move(indent)), blockMode_(blockMode), baseCol_(baseCol) {}

  void token(const lex::Token& tok) {
    place(tok.line, tok.col, tok.spaceBefore);
    out_ << tok.text;
    lastChar_ = tok.text.empty() ? lastChar_ : tok.text.back();
    prevLine_ = endLine(tok);
    forceBreak_ = isLineComment(tok);
  }

  void body(const ast::OpaqueBody& span, std::size_t skip) {
    for (const auto& seg : span.segments) {
      for (std::size_t idx = skip; idx < seg.tokens.size(); ++idx) { token(seg.tokens[idx]); }
      skip = 0;
      if (seg.anonymous) { anonymous(*seg.anonymous); }
    }
  }

  void anonymous(const ast::AnonymousClassExpr& anon) {
    const auto* info = plan_.find(&anon);
    if (info == nullptr) {
      throw exceptions::EmissionError("anonymous class was not planned", anon.file, anon.line, anon.col, "new");
    }
    const bool space = lastChar_ != '\0' && std::string("([{!.").find(lastChar_) == std::string::npos &&
                       std::isspace(static_cast<unsigned char>(lastChar_)) == 0;
    place(anon.line, anon.col, space);
    out_ << "new " << info->emittedName << '(';
    prevLine_ = anon.line;
    if (anon.args) { body(*anon.args, 0); }
    if (forceBreak_) {
      out_ << '\n' << indent_;
      forceBreak_ = false;
    }
    out_ << ')';
    lastChar_ = ')';
    prevLine_ = std::max(prevLine_, anon.endLine);
  }

  std::string finish() {
    if (forceBreak_ && !blockMode_) { out_ << '\n' << indent_; }
    return out_.str();
  }

 private:
  const LoweringPlan& plan_;
  std::string indent_;
  bool blockMode_;
  int baseCol_;
  std::ostringstream out_;
  int prevLine_{0};
  bool started_{false};
  bool forceBreak_{false};
  char lastChar_{'\0'};

  void place(const int line, const int col, const bool spaceBefore) {
    if (!started_) {
      started_ = true;
      if (blockMode_) { out_ << indent_ << std::string(static_cast<std::size_t>(std::max(0, col - baseCol_)), ' '); }
      return;
    }
    if (line > prevLine_ || forceBreak_) {
      out_ << '\n' << indent_ << std::string(static_cast<std::size_t>(std::max(0, col - baseCol_)), ' ');
      forceBreak_ = false;
      return;
    }
    if (spaceBefore) { out_ << ' '; }
  }
};

std::vector<const lex::Token*> topLevelTokens(const ast::OpaqueBody& body, std::size_t skip) {
  std::vector<const lex::Token*> out;
  for (const auto& seg : body.segments) {
    for (std::size_t idx = skip; idx < seg.tokens.size(); ++idx) { out.push_back(&seg.tokens[idx]); }
    skip = 0;
  }
  return out;
}

} // namespace

std::string BodyWriter::block(const ast::OpaqueBody& body, const int depth, const std::size_t skip) const {
  TokenPrinter printer{plan_, indent(depth), true, baseColumn(topLevelTokens(body, skip), true)};
  printer.body(body, skip);
  return printer.finish();
}

std::string BodyWriter::expression(const ast::OpaqueBody& body, const int depth) const {
  TokenPrinter printer{plan_, indent(depth), false, baseColumn(topLevelTokens(body, 0), false)};
  printer.body(body, 0);
  return printer.finish();
}

std::string BodyWriter::expression(const std::vector<lex::Token>& tokens, const int depth) const {
  std::vector<const lex::Token*> ptrs;
  ptrs.reserve(tokens.size());
  for (const auto& tok : tokens) { ptrs.push_back(&tok); }
  TokenPrinter printer{plan_, indent(depth), false, baseColumn(ptrs, false)};
  for (const auto& tok : tokens) { printer.token(tok); }
  return printer.finish();
}

} // namespace nestport::emit

/***
 * Name: nestport::lex::Lexer
 * Purpose: Tokenize source(s) into a single token vector (LIFO inputs).
 */
#include "lexer/Lexer.h"
#include "lexer/FileInput.h"
#include "lexer/StringInput.h"
#include "nestport/exceptions/file_read_error.h"
#include "nestport/exceptions/lex_error.h"
#include <array>
#include <cctype>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nestport::lex {

static bool isIdentStart(char chr) {
  const auto uch = static_cast<unsigned char>(chr);
  // Bytes >= 0x80 belong to UTF-8 sequences; decompiled names frequently use them
  return (std::isalpha(uch) != 0) || chr == '_' || chr == '$' || uch >= 0x80;
}
static bool isIdentChar(char chr) {
  return isIdentStart(chr) || (std::isdigit(static_cast<unsigned char>(chr)) != 0);
}

void Lexer::pushFile(const std::string& path) {
  auto input = std::make_unique<FileInput>(path);
  if (!input->isOpen()) {
    throw exceptions::FileReadError("failed to open file: " + path);
  }
  State state;
  state.src = std::move(input);
  stack_.push_back(std::move(state));
  finalized_ = false;
}


void Lexer::pushString(const std::string& text, const std::string& name) {
  State state;
  state.src = std::make_unique<StringInput>(text, name);
  stack_.push_back(std::move(state));
  finalized_ = false;
}


bool Lexer::readNextLine(State& state) {
  state.line.clear();
  if (!state.src->readLine(state.line)) { return false; }
  state.lineNo = state.src->lineNo();
  state.index = 0;
  return true;
}

bool Lexer::continueBlockComment(State& state) {
  const auto close = state.line.find("*/", state.index);
  if (close == std::string::npos) {
    state.pendingComment.text += state.line.substr(state.index);
    state.pendingComment.text += "\n";
    state.index = state.line.size();
    return false;
  }
  state.pendingComment.text += state.line.substr(state.index, close + 2 - state.index);
  state.index = close + 2;
  state.inBlockComment = false;
  tokens_.push_back(std::move(state.pendingComment));
  state.pendingComment = Token{};
  return true;
}

// Multi-character operators, longest first. '>' is never combined with another
// '>' so that nested type argument lists close one bracket at a time.
static constexpr std::array<std::string_view, 20> kMultiCharOps = {
    "<<=", "->", "::", "++", "--", "&&", "||", "==", "!=", "<=", "<<",
    "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", ">="};

static const std::unordered_map<std::string, TokenKind>& keywordTable() {
  static const std::unordered_map<std::string, TokenKind> table = {
      {"class", TokenKind::Class},       {"interface", TokenKind::Interface},
      {"enum", TokenKind::Enum},         {"extends", TokenKind::Extends},
      {"implements", TokenKind::Implements}, {"throws", TokenKind::Throws},
      {"new", TokenKind::New},           {"package", TokenKind::Package},
      {"import", TokenKind::Import},     {"void", TokenKind::Void},
      {"super", TokenKind::Super},       {"public", TokenKind::Public},
      {"private", TokenKind::Private},   {"protected", TokenKind::Protected},
      {"static", TokenKind::Static},     {"final", TokenKind::Final},
      {"abstract", TokenKind::Abstract}, {"native", TokenKind::Native},
      {"synchronized", TokenKind::Synchronized}, {"transient", TokenKind::Transient},
      {"volatile", TokenKind::Volatile}, {"strictfp", TokenKind::Strictfp},
      {"default", TokenKind::Default},   {"true", TokenKind::BoolLit},
      {"false", TokenKind::BoolLit},     {"null", TokenKind::NullLit},
      {"boolean", TokenKind::PrimitiveType}, {"byte", TokenKind::PrimitiveType},
      {"char", TokenKind::PrimitiveType}, {"short", TokenKind::PrimitiveType},
      {"int", TokenKind::PrimitiveType}, {"long", TokenKind::PrimitiveType},
      {"float", TokenKind::PrimitiveType}, {"double", TokenKind::PrimitiveType},
      {"assert", TokenKind::Keyword},    {"break", TokenKind::Keyword},
      {"case", TokenKind::Keyword},      {"catch", TokenKind::Keyword},
      {"const", TokenKind::Keyword},     {"continue", TokenKind::Keyword},
      {"do", TokenKind::Keyword},        {"else", TokenKind::Keyword},
      {"finally", TokenKind::Keyword},   {"for", TokenKind::Keyword},
      {"goto", TokenKind::Keyword},      {"if", TokenKind::Keyword},
      {"instanceof", TokenKind::Keyword}, {"return", TokenKind::Keyword},
      {"switch", TokenKind::Keyword},    {"this", TokenKind::Keyword},
      {"throw", TokenKind::Keyword},     {"try", TokenKind::Keyword},
      {"while", TokenKind::Keyword}};
  return table;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
Token Lexer::scanOne(State& state, const bool spaceBefore) {
  const auto& line = state.line;
  size_t& idx = state.index;

  auto makeTok = [&](TokenKind kind, size_t start, size_t endExclusive) {
    Token tok;
    tok.kind = kind;
    tok.text = line.substr(start, endExclusive - start);
    tok.file = state.src->name();
    tok.line = state.lineNo;
    tok.col = static_cast<int>(start + 1);
    tok.spaceBefore = spaceBefore;
    return tok;
  };
  auto fail = [&](const std::string& what, size_t start) -> Token {
    throw exceptions::LexError(what, state.src->name(), state.lineNo, static_cast<int>(start + 1),
                               line.substr(start, 1));
  };

  const char chr = line[idx];
  const size_t start = idx;

  if (chr == '/' && idx + 1 < line.size() && line[idx + 1] == '/') {
    idx = line.size();
    return makeTok(TokenKind::Comment, start, idx);
  }
  if (chr == '/' && idx + 1 < line.size() && line[idx + 1] == '*') {
    const auto close = line.find("*/", idx + 2);
    if (close != std::string::npos) {
      idx = close + 2;
      return makeTok(TokenKind::Comment, start, idx);
    }
    // Continues on following lines; finished by continueBlockComment
    state.inBlockComment = true;
    state.pendingComment = makeTok(TokenKind::Comment, start, line.size());
    state.pendingComment.text += "\n";
    idx = line.size();
    return Token{};
  }

  switch (chr) {
    case '{': ++idx; return makeTok(TokenKind::LBrace, start, idx);
    case '}': ++idx; return makeTok(TokenKind::RBrace, start, idx);
    case '(': ++idx; return makeTok(TokenKind::LParen, start, idx);
    case ')': ++idx; return makeTok(TokenKind::RParen, start, idx);
    case '[': ++idx; return makeTok(TokenKind::LBracket, start, idx);
    case ']': ++idx; return makeTok(TokenKind::RBracket, start, idx);
    case ';': ++idx; return makeTok(TokenKind::Semi, start, idx);
    case ',': ++idx; return makeTok(TokenKind::Comma, start, idx);
    case '@': ++idx; return makeTok(TokenKind::At, start, idx);
    case '?': ++idx; return makeTok(TokenKind::Question, start, idx);
    case '~': ++idx; return makeTok(TokenKind::Operator, start, idx);
    default: break;
  }

  if (chr == '"' || chr == '\'') {
    if (chr == '"' && line.compare(idx, 3, "\"\"\"") == 0) {
      return fail("text blocks are not supported", start);
    }
    size_t endPos = idx + 1;
    bool escape = false;
    bool closed = false;
    for (; endPos < line.size(); ++endPos) {
      const char c = line[endPos];
      if (escape) { escape = false; continue; }
      if (c == '\\') { escape = true; continue; }
      if (c == chr) { ++endPos; closed = true; break; }
    }
    if (!closed) {
      return fail(chr == '"' ? "unterminated string literal" : "unterminated character literal", start);
    }
    idx = endPos;
    return makeTok(chr == '"' ? TokenKind::StringLit : TokenKind::CharLit, start, idx);
  }

  auto isDecDigit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
  auto isHexDigit = [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; };
  auto isBinDigit = [](char c) { return c == '0' || c == '1'; };
  auto scanDigitsUnderscore = [&](size_t pos, auto isOk) {
    size_t i = pos;
    while (i < line.size() && (isOk(line[i]) || line[i] == '_')) { ++i; }
    return i;
  };
  auto scanExponent = [&](size_t pos) -> size_t {
    if (pos < line.size() && (line[pos] == 'e' || line[pos] == 'E')) {
      size_t i = pos + 1;
      if (i < line.size() && (line[i] == '+' || line[i] == '-')) { ++i; }
      const size_t digitsStart = i;
      i = scanDigitsUnderscore(i, isDecDigit);
      if (i == digitsStart) { return pos; } // back out if no digits
      return i;
    }
    return pos;
  };
  const bool dotDigit = chr == '.' && idx + 1 < line.size() && isDecDigit(line[idx + 1]);
  if (isDecDigit(chr) || dotDigit) {
    size_t p = idx;
    bool isFloat = false;
    if (chr == '0' && idx + 1 < line.size() && (line[idx + 1] == 'x' || line[idx + 1] == 'X')) {
      p = scanDigitsUnderscore(idx + 2, isHexDigit);
    } else if (chr == '0' && idx + 1 < line.size() && (line[idx + 1] == 'b' || line[idx + 1] == 'B')) {
      p = scanDigitsUnderscore(idx + 2, isBinDigit);
    } else {
      p = scanDigitsUnderscore(idx, isDecDigit);
      if (p < line.size() && line[p] == '.' && !(p + 1 < line.size() && line[p + 1] == '.')) {
        isFloat = true;
        p = scanDigitsUnderscore(p + 1, isDecDigit);
      }
      const size_t epos = scanExponent(p);
      if (epos != p) { isFloat = true; p = epos; }
      if (p < line.size() && (line[p] == 'f' || line[p] == 'F' || line[p] == 'd' || line[p] == 'D')) {
        isFloat = true;
        ++p;
        idx = p;
        return makeTok(TokenKind::FloatLit, start, idx);
      }
    }
    if (!isFloat && p < line.size() && (line[p] == 'l' || line[p] == 'L')) { ++p; }
    if (p < line.size() && isIdentChar(line[p])) {
      return fail("malformed numeric literal", start);
    }
    idx = p;
    return makeTok(isFloat ? TokenKind::FloatLit : TokenKind::IntLit, start, idx);
  }

  if (isIdentStart(chr)) {
    size_t jpos = idx + 1;
    while (jpos < line.size() && isIdentChar(line[jpos])) { ++jpos; }
    const std::string ident = line.substr(idx, jpos - idx);
    TokenKind kind = TokenKind::Ident;
    const auto& table = keywordTable();
    if (const auto found = table.find(ident); found != table.end()) { kind = found->second; }
    idx = jpos;
    return makeTok(kind, start, idx);
  }

  if (chr == '.') {
    if (line.compare(idx, 3, "...") == 0) { idx += 3; return makeTok(TokenKind::Ellipsis, start, idx); }
    ++idx; return makeTok(TokenKind::Dot, start, idx);
  }

  for (const auto op : kMultiCharOps) {
    if (line.compare(idx, op.size(), op) == 0) {
      idx += op.size();
      return makeTok(TokenKind::Operator, start, idx);
    }
  }

  switch (chr) {
    case '<': ++idx; return makeTok(TokenKind::Lt, start, idx);
    case '>': ++idx; return makeTok(TokenKind::Gt, start, idx);
    case '=': ++idx; return makeTok(TokenKind::Equal, start, idx);
    case ':': ++idx; return makeTok(TokenKind::Colon, start, idx);
    case '&': ++idx; return makeTok(TokenKind::Amp, start, idx);
    case '+': case '-': case '*': case '/': case '%': case '!': case '|': case '^':
      ++idx; return makeTok(TokenKind::Operator, start, idx);
    default: break;
  }

  return fail("unexpected character", start);
}

void Lexer::scanLine(State& state) {
  bool spaceBefore = true; // start of line counts as whitespace
  while (state.index < state.line.size()) {
    const char chr = state.line[state.index];
    if (chr == ' ' || chr == '\t' || chr == '\f') {
      ++state.index;
      spaceBefore = true;
      continue;
    }
    Token tok = scanOne(state, spaceBefore);
    if (state.inBlockComment) { return; }
    tokens_.push_back(std::move(tok));
    spaceBefore = false;
  }
}

void Lexer::buildAll() {
  if (finalized_) { return; }
  finalized_ = true;
  tokens_.clear();
  std::string lastFile;
  int lastLine = 1;
  // Process stack in LIFO order
  while (!stack_.empty()) {
    State state = std::move(stack_.back());
    stack_.pop_back();
    lastFile = state.src->name();
    while (readNextLine(state)) {
      lastLine = state.lineNo;
      if (state.inBlockComment && !continueBlockComment(state)) { continue; }
      scanLine(state);
    }
    if (state.inBlockComment) {
      const auto& open = state.pendingComment;
      throw exceptions::LexError("unterminated block comment", open.file, open.line, open.col, "/*");
    }
  }
  // Final EOF, located on the last line read so end-of-input errors point somewhere real
  Token eof;
  eof.kind = TokenKind::End;
  eof.text = "<EOF>";
  eof.file = lastFile;
  eof.line = lastLine;
  eof.col = 1;
  tokens_.push_back(eof);
}

const std::vector<Token>& Lexer::tokens() {
  if (!finalized_) { buildAll(); }
  return tokens_;
}

} // namespace nestport::lex

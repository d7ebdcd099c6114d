/**
 * Name: nestport::lex::Token
 * Purpose: Token structure with source location and text.
 */
#pragma once

#include <string>
#include "lexer/TokenKind.h"

namespace nestport::lex {

struct Token {
    TokenKind kind{TokenKind::End};
    std::string text{}; // original text
    std::string file{};
    int line{1}; // 1-based line number
    int col{1}; // 1-based column at token start
    bool spaceBefore{false}; // whitespace or line start precedes the token
};

} // namespace nestport::lex

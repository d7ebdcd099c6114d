/**
 * Name: nestport::lex::TokenKind
 * Purpose: Token kinds for the lexer.
 */
#pragma once

namespace nestport::lex {

enum class TokenKind {
    End, // EOF
    Comment, // // ... or /* ... */

    Ident, // identifier
    IntLit, // 42, 0x2A, 42L
    FloatLit, // 1.5, 1e3, 2f
    CharLit, // 'a'
    StringLit, // "..."
    BoolLit, // true/false
    NullLit, // null

    Class, // class
    Interface, // interface
    Enum, // enum
    Extends, // extends
    Implements, // implements
    Throws, // throws
    New, // new
    Package, // package
    Import, // import
    Void, // void
    Super, // super

    Public, // public
    Private, // private
    Protected, // protected
    Static, // static
    Final, // final
    Abstract, // abstract
    Native, // native
    Synchronized, // synchronized
    Transient, // transient
    Volatile, // volatile
    Strictfp, // strictfp
    Default, // default

    PrimitiveType, // boolean byte char short int long float double
    Keyword, // statement-only keywords (if, return, this, ...)

    LBrace, // {
    RBrace, // }
    LParen, // (
    RParen, // )
    LBracket, // [
    RBracket, // ]
    Lt, // <
    Gt, // > (always a single character)
    Semi, // ;
    Comma, // ,
    Dot, // .
    Ellipsis, // ...
    At, // @
    Equal, // =
    Question, // ?
    Colon, // :
    Amp, // &

    Operator // any other operator; text distinguishes
};

// Coarse classification used by diagnostics and the data model
enum class TokenCategory { Keyword, Identifier, Literal, Operator, Comment, Punctuation, End };

// Convert TokenKind to a stable string for diagnostics/logging
const char* to_string(TokenKind k);

TokenCategory category(TokenKind k);

// Access and non-access modifier keywords (annotations are handled separately)
bool isModifier(TokenKind k);

} // namespace nestport::lex

/**
 * Name: nestport::lex::TokenKind helpers
 * Purpose: Implementation for TokenKind utilities.
 */
#include "lexer/TokenKind.h"

namespace nestport::lex {
    const char *to_string(const TokenKind k) {
        using enum nestport::lex::TokenKind;
        switch (k) {
            case End: return "End";
            case Comment: return "Comment";
            case Ident: return "Ident";
            case IntLit: return "IntLit";
            case FloatLit: return "FloatLit";
            case CharLit: return "CharLit";
            case StringLit: return "StringLit";
            case BoolLit: return "BoolLit";
            case NullLit: return "NullLit";
            case Class: return "Class";
            case Interface: return "Interface";
            case Enum: return "Enum";
            case Extends: return "Extends";
            case Implements: return "Implements";
            case Throws: return "Throws";
            case New: return "New";
            case Package: return "Package";
            case Import: return "Import";
            case Void: return "Void";
            case Super: return "Super";
            case Public: return "Public";
            case Private: return "Private";
            case Protected: return "Protected";
            case Static: return "Static";
            case Final: return "Final";
            case Abstract: return "Abstract";
            case Native: return "Native";
            case Synchronized: return "Synchronized";
            case Transient: return "Transient";
            case Volatile: return "Volatile";
            case Strictfp: return "Strictfp";
            case Default: return "Default";
            case PrimitiveType: return "PrimitiveType";
            case Keyword: return "Keyword";
            case LBrace: return "LBrace";
            case RBrace: return "RBrace";
            case LParen: return "LParen";
            case RParen: return "RParen";
            case LBracket: return "LBracket";
            case RBracket: return "RBracket";
            case Lt: return "Lt";
            case Gt: return "Gt";
            case Semi: return "Semi";
            case Comma: return "Comma";
            case Dot: return "Dot";
            case Ellipsis: return "Ellipsis";
            case At: return "At";
            case Equal: return "Equal";
            case Question: return "Question";
            case Colon: return "Colon";
            case Amp: return "Amp";
            case Operator: return "Operator";
        }
        return "Unknown";
    }

    TokenCategory category(const TokenKind k) {
        using enum nestport::lex::TokenKind;
        switch (k) {
            case End: return TokenCategory::End;
            case Comment: return TokenCategory::Comment;
            case Ident: return TokenCategory::Identifier;
            case IntLit:
            case FloatLit:
            case CharLit:
            case StringLit:
            case BoolLit:
            case NullLit: return TokenCategory::Literal;
            case LBrace:
            case RBrace:
            case LParen:
            case RParen:
            case LBracket:
            case RBracket:
            case Semi:
            case Comma:
            case Dot:
            case Ellipsis:
            case At: return TokenCategory::Punctuation;
            case Lt:
            case Gt:
            case Equal:
            case Question:
            case Colon:
            case Amp:
            case Operator: return TokenCategory::Operator;
            default: return TokenCategory::Keyword;
        }
    }

    bool isModifier(const TokenKind k) {
        using enum nestport::lex::TokenKind;
        switch (k) {
            case Public:
            case Private:
            case Protected:
            case Static:
            case Final:
            case Abstract:
            case Native:
            case Synchronized:
            case Transient:
            case Volatile:
            case Strictfp:
            case Default: return true;
            default: return false;
        }
    }
} // namespace nestport::lex

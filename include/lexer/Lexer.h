/**
 * Name: nestport::lex::Lexer
 * Purpose: Tokenize a stack of input sources (LIFO) into one flat token vector.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "lexer/InputSource.h"
#include "lexer/Token.h"

namespace nestport::lex {

class Lexer {
public:
    Lexer() = default;

    // Throws exceptions::FileReadError when the file cannot be opened
    void pushFile(const std::string& path);

    void pushString(const std::string& text, const std::string& name);

    // Full token sequence terminated by a single End token.
    // Throws exceptions::LexError on malformed input.
    const std::vector<Token>& tokens();

private:
    bool finalized_{false};
    std::vector<Token> tokens_{};

    struct State {
        std::unique_ptr<InputSource> src;
        std::string line;
        size_t index{0};
        int lineNo{0};
        // Block comment spanning lines
        bool inBlockComment{false};
        Token pendingComment{};
    };

    std::vector<State> stack_{}; // LIFO of inputs

    // helpers
    bool readNextLine(State& state); // load next line into state
    void scanLine(State& state); // tokenize the rest of the current line
    bool continueBlockComment(State& state); // true when the comment closed on this line
    Token scanOne(State& state, bool spaceBefore); // scan a single token at state.index

    void buildAll(); // build tokens_ from all inputs (LIFO)
};

} // namespace nestport::lex

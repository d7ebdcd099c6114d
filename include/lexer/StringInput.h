/**
 * Name: nestport::lex::StringInput
 * Purpose: In-memory source text under a caller-chosen file name.
 */
#pragma once

#include <string>
#include "lexer/InputSource.h"

namespace nestport::lex {

class StringInput final : public InputSource {
public:
    StringInput(std::string text, std::string name);
};

} // namespace nestport::lex

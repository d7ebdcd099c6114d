/**
 * Name: nestport::lex::FileInput
 * Purpose: Source file opened in binary mode; the path doubles as the token file name.
 */
#pragma once

#include <string>
#include "lexer/InputSource.h"

namespace nestport::lex {

class FileInput final : public InputSource {
public:
    explicit FileInput(const std::string& path);

    bool isOpen() const;
};

} // namespace nestport::lex

/***
 * Name: nestport::exceptions::LexError
 * Purpose: Exception for characters the tokenizer cannot classify.
 * Inputs: Detail message and the offending token's provenance
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from SourceError.
 */
#pragma once

#include "nestport/exceptions/source_error.h"

namespace nestport {
namespace exceptions {

class LexError : public SourceError {
 public:
  LexError(std::string detail, std::string file, int line, int col, std::string text)
      : SourceError(std::move(detail), std::move(file), line, col, std::move(text)) {}
};

}  // namespace exceptions
}  // namespace nestport

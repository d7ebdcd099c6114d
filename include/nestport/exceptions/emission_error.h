/***
 * Name: nestport::exceptions::EmissionError
 * Purpose: Exception for an unresolved reference found during code generation.
 * Inputs: Detail message and the offending token's provenance
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from SourceError.
 */
#pragma once

#include "nestport/exceptions/source_error.h"

namespace nestport {
namespace exceptions {

class EmissionError : public SourceError {
 public:
  EmissionError(std::string detail, std::string file, int line, int col, std::string text)
      : SourceError(std::move(detail), std::move(file), line, col, std::move(text)) {}
};

}  // namespace exceptions
}  // namespace nestport

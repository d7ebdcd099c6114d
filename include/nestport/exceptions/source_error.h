/***
 * Name: nestport::exceptions::SourceError
 * Purpose: Base for errors that point at a single token or group in the input.
 * Inputs:
 *   - detail: human-readable description without location
 *   - file, line, col: provenance of the offending token (1-based)
 *   - text: literal text of the offending token or group opener
 * Outputs: Exception object whose what() reads "file:line:col: detail ('text')"
 * Theory of Operation: Provenance flows unchanged from the tokenizer through
 *   grouping, matching and parsing, so every stage can report the exact token.
 */
#pragma once

#include <string>
#include <utility>

#include "nestport/exceptions/nestport_exception.h"

namespace nestport {
namespace exceptions {

class SourceError : public NestportException {
 public:
  const std::string& detail() const noexcept { return detail_; }
  const std::string& file() const noexcept { return file_; }
  int line() const noexcept { return line_; }
  int col() const noexcept { return col_; }
  const std::string& text() const noexcept { return text_; }

 protected:
  SourceError(std::string detail, std::string file, int line, int col, std::string text);

 private:
  std::string detail_;
  std::string file_;
  int line_{0};
  int col_{0};
  std::string text_;
};

}  // namespace exceptions
}  // namespace nestport

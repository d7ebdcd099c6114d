/***
 * Name: nestport::exceptions::SourceError::SourceError
 * Purpose: Construct a located error and pre-format its what() text.
 * Inputs:
 *   - detail: description without location
 *   - file, line, col: provenance of the offending token
 *   - text: literal text of the offending token or group opener
 * Outputs: Initialized exception object
 * Theory of Operation: Formats "file:line:col: detail ('text')"; the file part is
 *   omitted for anonymous inputs and the text part for empty text.
 */
#include "nestport/exceptions/source_error.h"

#include <sstream>

namespace nestport::exceptions {

static std::string FormatLocated(const std::string& detail, const std::string& file, int line, int col,
                                 const std::string& text) {
  std::ostringstream out;
  if (!file.empty()) {
    out << file << ":";
  }
  out << line << ":" << col << ": " << detail;
  if (!text.empty()) {
    out << " ('" << text << "')";
  }
  return out.str();
}

SourceError::SourceError(std::string detail, std::string file, int line, int col, std::string text)
    : NestportException(FormatLocated(detail, file, line, col, text)),
      detail_(std::move(detail)),
      file_(std::move(file)),
      line_(line),
      col_(col),
      text_(std::move(text)) {}

}  // namespace nestport::exceptions

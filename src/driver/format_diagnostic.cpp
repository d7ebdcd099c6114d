/***
 * Name: nestport::driver::FormatDiagnostic
 * Purpose: Render a located error with its source line and a caret.
 * Inputs:
 *   - error: located exception (file, line, col, detail, text)
 *   - source: full text of the file the error points into (may be empty)
 *   - color: wrap location in bold and the label in red
 * Outputs: Multi-line diagnostic text ending in '\n'
 * Theory of Operation: The caret line copies tabs from the source line so the
 *   caret stays under the column however the terminal expands tabs. The source
 *   excerpt is skipped when the line is out of range (end of input).
 */
#include "nestport/driver/diagnostics.h"

#include <cstddef>
#include <sstream>
#include <string>
#include <string_view>

namespace nestport::driver {

// ANSI fragments
static constexpr std::string_view kRed = "\033[31m";
static constexpr std::string_view kBold = "\033[1m";
static constexpr std::string_view kReset = "\033[0m";

static bool SourceLine(std::string_view source, int line, std::string_view& out) {
  if (line <= 0) {
    return false;
  }
  std::size_t start = 0;
  for (int current = 1; current < line; ++current) {
    const std::size_t newline = source.find('\n', start);
    if (newline == std::string_view::npos) {
      return false;
    }
    start = newline + 1;
  }
  if (start >= source.size()) {
    return false;
  }
  std::size_t end = source.find('\n', start);
  if (end == std::string_view::npos) {
    end = source.size();
  }
  if (end > start && source[end - 1] == '\r') {
    --end;
  }
  out = source.substr(start, end - start);
  return true;
}

static void PrintHeader(std::ostringstream& out, const exceptions::SourceError& error, bool color) {
  if (color) { out << kBold; }
  if (!error.file().empty()) {
    out << error.file() << ":";
  }
  out << error.line() << ":" << error.col() << ": ";
  if (color) { out << kReset; }
}

static void PrintLabel(std::ostringstream& out, bool color) {
  if (color) {
    out << kRed << "error: " << kReset;
  } else {
    out << "error: ";
  }
}

static void PrintSourceWithCaret(std::ostringstream& out, std::string_view source, int line, int col) {
  std::string_view text;
  if (col <= 0 || !SourceLine(source, line, text)) {
    return;
  }
  out << "  " << text << '\n' << "  ";
  for (int i = 1; i < col; ++i) {
    const auto idx = static_cast<std::size_t>(i - 1);
    out << (idx < text.size() && text[idx] == '\t' ? '\t' : ' ');
  }
  out << "^\n";
}

auto FormatDiagnostic(const exceptions::SourceError& error, std::string_view source, bool color) -> std::string {
  std::ostringstream out;
  PrintHeader(out, error, color);
  PrintLabel(out, color);
  out << error.detail();
  if (!error.text().empty()) {
    out << " ('" << error.text() << "')";
  }
  out << '\n';
  PrintSourceWithCaret(out, source, error.line(), error.col());
  return out.str();
}

}  // namespace nestport::driver

/***
 * Name: nestport::driver (diagnostics)
 * Purpose: Render located errors the way compilers do.
 * Inputs: A SourceError and the text of the file it points into
 * Outputs: "file:line:col: error: message", the source line and a caret
 * Theory of Operation: Formatting is separate from printing so worker threads
 *   can buffer diagnostics. Bold location and red label when color is on.
 */
#pragma once

#include <string>
#include <string_view>

#include "nestport/exceptions/source_error.h"

namespace nestport {
namespace driver {

std::string FormatDiagnostic(const exceptions::SourceError& error, std::string_view source, bool color);

/*** FormatError: Unlocated error with the same label ("nestport: error: msg"). */
std::string FormatError(std::string_view message, bool color);

}  // namespace driver
}  // namespace nestport

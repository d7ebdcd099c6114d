/***
 * Name: nestport::support::ReadFile
 * Purpose: Read the full contents of a source file into a string.
 * Inputs:
 *   - path: filesystem path to read
 * Outputs:
 *   - out: populated with file contents on success
 *   - err: error message on failure
 * Theory of Operation: Binary ifstream so line endings reach the lexer untouched;
 *   directories are rejected up front because they open successfully on Linux.
 */
#include "nestport/support/fs.h"

#include <filesystem>
#include <fstream>
#include <ios>
#include <sstream>
#include <string>
#include <system_error>

namespace nestport {
namespace support {

bool ReadFile(const std::string& path, std::string& out, std::string& err) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    err = "is a directory: " + path;
    return false;
  }
  std::ifstream file_stream(path, std::ios::binary);
  if (!file_stream.good()) {
    err = "failed to open file: " + path;
    return false;
  }
  std::ostringstream stream;
  stream << file_stream.rdbuf();
  if (file_stream.bad()) {
    err = "failed to read file: " + path;
    return false;
  }
  out = stream.str();
  return true;
}

}  // namespace support
}  // namespace nestport

/***
 * Name: nestport::support::WriteFile
 * Purpose: Write the full contents of a string into a file.
 * Inputs:
 *   - path: filesystem path to write
 *   - data: content to write
 * Outputs:
 *   - err: error message on failure
 * Theory of Operation: Creates the parent directory chain (for --out-dir),
 *   then uses std::ofstream and checks .good().
 */
#include "nestport/support/fs.h"

#include <filesystem>
#include <fstream>
#include <ios>
#include <string>
#include <system_error>

namespace nestport {
namespace support {

bool WriteFile(const std::string& path, const std::string& data, std::string& err) {
  const std::filesystem::path target(path);
  if (target.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      err = "failed to create directory " + target.parent_path().string() + ": " + ec.message();
      return false;
    }
  }
  std::ofstream file_stream(path, std::ios::binary);
  if (!file_stream.good()) {
    err = "failed to open file for write: " + path;
    return false;
  }
  file_stream << data;
  if (!file_stream.good()) {
    err = "failed to write file: " + path;
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace nestport

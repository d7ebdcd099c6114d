/***
 * Name: nestport::driver::WriteFileOrReport
 * Purpose: Write a file and standardize error reporting.
 * Inputs:
 *   - path: destination path
 *   - data: content to write
 *   - err: receives detailed error text on failure
 *   - diag: sink for the 'nestport: ' prefixed message
 * Outputs:
 *   - bool: true on success, false on failure (message written)
 */
#include "nestport/driver/app.h"
#include "nestport/stages/file_writer.h"

#include <ostream>
#include <string>

namespace nestport::driver {

auto WriteFileOrReport(const std::string& path, const std::string& data, std::string& err, std::ostream& diag)
    -> bool {
  const bool is_ok = stages::FileWriter::Write(path, data, err);
  if (!is_ok) {
    diag << "nestport: error: " << err << '\n';
  }
  return is_ok;
}

}  // namespace nestport::driver

/***
 * Name: nestport::driver::detail::HandleUnknownOrPositional
 * Purpose: Reject arguments beginning with '-' that no earlier handler claimed;
 *          record anything else as an input file.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult::Error for unknown option, OptResult::Handled otherwise.
 * Theory of Operation: Last entry of the handler table, so every argument is
 *   either consumed or rejected.
 */
#include "nestport/driver/cli_parse.h"
#include "nestport/driver/cli.h"

#include <ostream>
#include <string>

namespace nestport {
namespace driver {
namespace detail {

auto HandleUnknownOrPositional(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  if (arg.size() > 1 && arg[0] == '-') {
    err << "nestport: error: unknown option '" << arg << "'" << '\n';
    return OptResult::Error;
  }
  if (arg == "-") {
    err << "nestport: error: reading source from stdin is not supported" << '\n';
    return OptResult::Error;
  }
  if (!arg.empty()) {
    dst.inputs.push_back(arg);
  }
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace nestport

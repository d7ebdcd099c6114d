/***
 * Name: nestport::driver::detail::HandleEndOfOptions
 * Purpose: Handle the "--" token and push remaining inputs.
 * Inputs:
 *   - args: full argument vector
 *   - index: current index (will be advanced to the end)
 *   - argc: total argument count
 *   - dst: CLI options destination
 * Outputs: OptResult indicating match
 * Theory of Operation: Consumes "--" and appends every later argument as an
 *   input, so files whose names start with '-' can still be transpiled.
 */
#include "nestport/driver/cli_parse.h"
#include "nestport/driver/cli.h"

#include <cstddef>
#include <string>
#include <vector>

namespace nestport {
namespace driver {
namespace detail {

auto HandleEndOfOptions(const std::vector<std::string>& args,
                        int& index,
                        int argc,
                        CliOptions& dst) -> OptResult {
  if (args[static_cast<std::size_t>(index)] != "--") {
    return OptResult::NotMatched;
  }
  while (++index < argc) {
    const std::string& rest = args[static_cast<std::size_t>(index)];
    if (!rest.empty()) {
      dst.inputs.push_back(rest);
    }
  }
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace nestport

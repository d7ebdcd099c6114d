/***
 * Name: nestport::driver::detail::HandleSwitch
 * Purpose: Handle simple boolean switches: --keep-going, --dump-ast, --log-tokens.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 * Outputs: OptResult indicating match
 */
#include "nestport/driver/cli_parse.h"
#include "nestport/driver/cli.h"

#include <string>

namespace nestport {
namespace driver {
namespace detail {

auto HandleSwitch(const std::string& arg, CliOptions& dst) -> OptResult {
  if (arg == "--keep-going" || arg == "-k") {
    dst.keep_going = true;
    return OptResult::Handled;
  }
  if (arg == "--dump-ast") {
    dst.dump_ast = true;
    return OptResult::Handled;
  }
  if (arg == "--log-tokens") {
    dst.log_tokens = true;
    return OptResult::Handled;
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace nestport

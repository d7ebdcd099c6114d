/***
 * Name: nestport::driver::detail::HandleHelpArg
 * Purpose: Recognize -h/--help and mark show_help.
 */
#include "nestport/driver/cli_parse.h"
#include "nestport/driver/cli.h"

#include <string>

namespace nestport {
namespace driver {
namespace detail {

auto HandleHelpArg(const std::string& arg, CliOptions& dst) -> OptResult {
  if (arg != "-h" && arg != "--help") {
    return OptResult::NotMatched;
  }
  dst.show_help = true;
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace nestport

/***
 * Name: nestport::driver::detail::HandleColorArg
 * Purpose: Handle --color and --color=auto|always|never.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Bare --color means always. Auto defers to NESTPORT_COLOR.
 */
#include "nestport/driver/cli_parse.h"
#include "nestport/driver/cli.h"

#include <ostream>
#include <string>
#include <string_view>

namespace nestport {
namespace driver {
namespace detail {

auto HandleColorArg(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  if (arg == "--color") {
    dst.color = CliOptions::ColorMode::Always;
    return OptResult::Handled;
  }
  constexpr std::string_view kPrefix{"--color="};
  if (arg.rfind(kPrefix, 0) != 0U) {
    return OptResult::NotMatched;
  }
  const std::string value = arg.substr(kPrefix.size());
  if (value == "auto") {
    dst.color = CliOptions::ColorMode::Auto;
  } else if (value == "always") {
    dst.color = CliOptions::ColorMode::Always;
  } else if (value == "never") {
    dst.color = CliOptions::ColorMode::Never;
  } else {
    err << "nestport: error: unknown color mode '" << value << "' (expected auto, always or never)" << '\n';
    return OptResult::Error;
  }
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace nestport

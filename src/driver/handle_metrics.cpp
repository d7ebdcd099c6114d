/***
 * Name: nestport::driver::detail::HandleMetricsArg
 * Purpose: Handle --metrics and --metrics=json|text option.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Bare --metrics selects the text report; the '=' form
 *   must name one of the two formats.
 */
#include "nestport/driver/cli_parse.h"
#include "nestport/driver/cli.h"

#include <ostream>
#include <string>
#include <string_view>

namespace nestport {
namespace driver {
namespace detail {

auto HandleMetricsArg(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  constexpr std::string_view kName{"--metrics"};
  if (arg.rfind(kName, 0) != 0U) {
    return OptResult::NotMatched;
  }
  if (arg.size() == kName.size()) {
    dst.metrics = true;
    dst.metrics_format = CliOptions::MetricsFormat::Text;
    return OptResult::Handled;
  }
  if (arg[kName.size()] != '=') {
    return OptResult::NotMatched;
  }
  const std::string value = arg.substr(kName.size() + 1);
  if (value == "json") {
    dst.metrics_format = CliOptions::MetricsFormat::Json;
  } else if (value == "text") {
    dst.metrics_format = CliOptions::MetricsFormat::Text;
  } else {
    err << "nestport: error: unknown metrics format '" << value << "' (expected json or text)" << '\n';
    return OptResult::Error;
  }
  dst.metrics = true;
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace nestport

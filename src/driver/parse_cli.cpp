/***
 * Name: nestport::driver::ParseCli
 * Purpose: Parse command-line arguments into a CliOptions structure.
 * Inputs:
 *   - argc: Argument count
 *   - argv: Argument vector
 *   - dst: Output options structure to populate
 *   - err: Stream for diagnostics on parse errors
 * Outputs:
 *   - bool: true on successful parse, false if an error occurs
 * Theory of Operation:
 *   Normalizes argv, runs the handler table for each argument and stops at the
 *   first error. Help short-circuits the remaining checks. Output placement is
 *   validated last: -o names one file, so it excludes several inputs and
 *   --out-dir.
 */
#include "nestport/driver/cli.h"
#include "nestport/driver/cli_parse.h"

#include <ostream>
#include <string>
#include <vector>

namespace nestport::driver {

auto ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err) -> bool {
  // Reset to defaults
  dst = CliOptions{};

  std::vector<std::string> args;
  detail::NormalizeArgv(argc, argv, args);
  const int count = static_cast<int>(args.size());
  for (int arg_index = 1; arg_index < count; ++arg_index) {
    if (detail::RunHandlers(args, arg_index, count, dst, err) == detail::OptResult::Error) {
      return false;
    }
  }

  if (dst.show_help) {
    return true;
  }
  if (dst.inputs.empty()) {
    err << "nestport: error: no input files" << '\n';
    return false;
  }
  if (!dst.output.empty() && dst.inputs.size() > 1) {
    err << "nestport: error: cannot specify -o with multiple input files" << '\n';
    return false;
  }
  if (!dst.output.empty() && !dst.out_dir.empty()) {
    err << "nestport: error: -o and --out-dir are mutually exclusive" << '\n';
    return false;
  }
  return true;
}

}  // namespace nestport::driver

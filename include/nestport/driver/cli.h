/***
 * Name: nestport::driver (cli)
 * Purpose: Declarations for CLI options, parsing, and usage printing.
 * Inputs: N/A (declarations only)
 * Outputs: Types and functions for CLI handling.
 * Theory of Operation: Command-line flags are the only configuration surface
 *   (plus NESTPORT_COLOR). Definitions live in .cpp files, one per function.
 */
#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace nestport {
namespace driver {

/***
 * Name: nestport::driver::CliOptions
 * Purpose: Hold parsed command-line options for a nestport invocation.
 * Inputs: Values are populated by ParseCli.
 * Outputs: Consumed by the driver to control transpilation and reporting.
 */
struct CliOptions {
  std::vector<std::string> inputs;       // Input source files (.java)
  std::string output;                    // -o <file>; "-" is stdout; empty derives <stem>.h
  std::string out_dir;                   // --out-dir <dir>
  int jobs = 1;                          // -j <n>
  bool keep_going = false;               // --keep-going
  std::vector<std::string> known_types;  // --known-type <name>
  bool show_help = false;                // -h, --help
  bool metrics = false;                  // --metrics
  enum class MetricsFormat { Text, Json };
  MetricsFormat metrics_format = MetricsFormat::Text;  // --metrics[=json|text]
  bool dump_ast = false;                 // --dump-ast
  bool log_tokens = false;               // --log-tokens
  enum class ColorMode { Auto, Always, Never };
  ColorMode color = ColorMode::Auto;     // --color[=auto|always|never]
};

/***
 * Name: nestport::driver::detail::OptResult
 * Purpose: Tri-state result for option handlers.
 * Theory of Operation: Lets ParseCli stay a loop while small helpers own
 *   one option format each.
 */
namespace detail {
enum class OptResult { NotMatched, Handled, Error };
}

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
 * Theory of Operation: Runs the handler table over each argument, then checks
 *   combinations that only make sense once all arguments are known.
 */
bool ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err);

/***
 * Name: nestport::driver::PrintUsage
 * Purpose: Print CLI usage information for nestport.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 */
void PrintUsage(std::ostream& out, const char* argv0);

}  // namespace driver
}  // namespace nestport

/***
 * Name: nestport::driver (cli_parse helpers)
 * Purpose: Declarations for small, single-purpose CLI option handlers used by ParseCli.
 * Inputs: Argument string(s), index into args, CLI options destination, error stream
 * Outputs: detail::OptResult (NotMatched, Handled, Error)
 * Theory of Operation: Each function recognizes one category of options, mutates state,
 *   and advances the index where necessary, keeping ParseCli simple and low complexity.
 */
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "nestport/driver/cli.h"

namespace nestport {
namespace driver {
namespace detail {

/*** HandleMetricsArg: Parse --metrics and --metrics=.. variants. */
OptResult HandleMetricsArg(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** HandleColorArg: Parse --color and --color=auto|always|never. */
OptResult HandleColorArg(const std::string& arg, CliOptions& dst, std::ostream& err);

/***
 * HandleValueArg: Options taking one value. Short options accept -X<val> or -X <val>;
 * long options accept --name=<val> or --name <val>. The value lands in `value`.
 */
struct ValueArgParams {
  const std::string& opt;
  const std::vector<std::string>& args;
  int& index;
  int argc;
  const char* missing_msg;
  std::ostream& err;
};

OptResult HandleValueArg(const std::string& arg, const ValueArgParams& p, std::string& value);

/*** HandleSwitch: Handle booleans --keep-going, --dump-ast and --log-tokens. */
OptResult HandleSwitch(const std::string& arg, CliOptions& dst);

/*** HandleEndOfOptions: Handle "--" and push remaining inputs. */
OptResult HandleEndOfOptions(const std::vector<std::string>& args,
                             int& index,
                             int argc,
                             CliOptions& dst);

/*** HandleUnknownOrPositional: Error on unknown '-' options; otherwise record input. */
OptResult HandleUnknownOrPositional(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** HandleHelpArg: Recognize -h/--help and set flag. */
OptResult HandleHelpArg(const std::string& arg, CliOptions& dst);

/*** NormalizeArgv: Convert argv into vector<string> with null safety. */
void NormalizeArgv(int argc, const char* const* argv, std::vector<std::string>& out);

/*** RunHandlers: Execute ordered handlers for current arg index. */
OptResult RunHandlers(const std::vector<std::string>& args,
                      int& index,
                      int argc,
                      CliOptions& dst,
                      std::ostream& err);

}  // namespace detail
}  // namespace driver
}  // namespace nestport

/***
 * Name: nestport::driver (app API)
 * Purpose: Declarations for top-level driver helpers used by main().
 * Inputs: CLI options and paths
 * Outputs: Output paths, per-file outcomes, status codes
 * Theory of Operation: Keep main() minimal by factoring helpers into separate
 *   translation units; one function per .cpp file.
 */
#pragma once

#include <ostream>
#include <string>

#include "emitter/EmitOptions.h"
#include "nestport/driver/cli.h"

namespace nestport {
namespace driver {

/*** Process exit codes. */
inline constexpr int kExitOk = 0;
inline constexpr int kExitTranslationError = 1;
inline constexpr int kExitUsageOrIo = 2;

/***
 * Name: nestport::driver::FileOutcome
 * Purpose: Everything one input produced, buffered so parallel workers can be
 *   reported in input order.
 */
struct FileOutcome {
  int status{kExitOk};
  std::string out;  // --dump-ast, --log-tokens and "-o -" text
  std::string err;  // diagnostics
};

/***
 * Name: nestport::driver::DeriveOutputPath
 * Purpose: Destination of the generated header for one input.
 * Theory of Operation: -o wins; otherwise the input's extension is replaced by
 *   ".h", beside the input or inside --out-dir.
 */
std::string DeriveOutputPath(const driver::CliOptions& opts, const std::string& input_path);

/***
 * Name: nestport::driver::MakeEmitOptions
 * Purpose: EmitOptions for one input, with --known-type names added to the defaults.
 */
emit::EmitOptions MakeEmitOptions(const driver::CliOptions& opts, const std::string& input_path);

/***
 * Name: nestport::driver::UseColor
 * Purpose: Resolve --color against NESTPORT_COLOR.
 */
bool UseColor(const driver::CliOptions& opts);

/***
 * Name: nestport::driver::UseEnvColor
 * Purpose: True when NESTPORT_COLOR is 1, true or yes (any case).
 */
bool UseEnvColor();

/***
 * Name: nestport::driver::WriteFileOrReport
 * Purpose: Write file and report an error to `diag` on failure.
 * Inputs: path, data, err (for detail), diag (diagnostic sink)
 * Outputs: true on success, false on error (and message written)
 * Theory of Operation: Wraps stages::FileWriter with unified reporting.
 */
bool WriteFileOrReport(const std::string& path, const std::string& data, std::string& err, std::ostream& diag);

/***
 * Name: nestport::driver::ReportMetricsIfRequested
 * Purpose: Write the metrics summary to `out` in the requested format when --metrics is set.
 */
void ReportMetricsIfRequested(const driver::CliOptions& opts, std::ostream& out);

/***
 * Name: nestport::driver::TranspileOnce
 * Purpose: Execute one end-to-end translation from source path to header.
 * Inputs: opts (CLI options), input_path
 * Outputs: FileOutcome with status 0, 1 (source error) or 2 (I/O error)
 * Theory of Operation: read -> lex -> group -> parse -> emit -> write. Source
 *   errors become caret diagnostics; nothing is written for a failed file.
 */
FileOutcome TranspileOnce(const driver::CliOptions& opts, const std::string& input_path);

/***
 * Name: nestport::driver::TranspileAll
 * Purpose: Translate every input, on up to opts.jobs worker threads.
 * Inputs: opts, out/err streams receiving the buffered per-file output
 * Outputs: Highest status of any processed file
 * Theory of Operation: Workers claim inputs in order from a shared counter.
 *   Without --keep-going no new file is started after a failure. Outcomes are
 *   flushed in input order once all workers have joined.
 */
int TranspileAll(const driver::CliOptions& opts, std::ostream& out, std::ostream& err);

}  // namespace driver
}  // namespace nestport

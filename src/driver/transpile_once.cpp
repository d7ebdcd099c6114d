/***
 * Name: nestport::driver::TranspileOnce
 * Purpose: Execute one end-to-end translation (read -> frontend -> emit -> write).
 * Inputs:
 *   - opts: CLI options
 *   - input_path: path to the source file
 * Outputs:
 *   - FileOutcome: status 0 on success, 1 for errors in the source, 2 for I/O
 *     errors; buffered stdout and diagnostic text
 * Theory of Operation: Located errors are rendered against the source text
 *   already in memory. The header is only written once emission succeeded,
 *   so a failed file never leaves partial output behind.
 */
#include "nestport/driver/app.h"

#include <memory>
#include <sstream>
#include <string>

#include "nestport/driver/diagnostics.h"
#include "nestport/exceptions/nestport_exception.h"
#include "nestport/exceptions/source_error.h"
#include "nestport/stages/cpp_emitter.h"
#include "nestport/stages/file_reader.h"
#include "nestport/stages/frontend.h"
#include "observability/AstPrinter.h"

namespace nestport::driver {

auto TranspileOnce(const driver::CliOptions& opts, const std::string& input_path) -> FileOutcome {
  FileOutcome outcome{};
  const bool color = UseColor(opts);

  std::string source_text;
  std::string error_message;
  if (!stages::FileReader::Read(input_path, source_text, error_message)) {
    outcome.status = kExitUsageOrIo;
    outcome.err = FormatError(error_message, color);
    return outcome;
  }

  std::ostringstream out;
  std::string header;
  try {
    stages::Frontend front;
    const auto file = front.Build(source_text, input_path, opts.log_tokens ? &out : nullptr);
    if (opts.dump_ast) {
      out << obs::AstPrinter().print(*file);
    }
    stages::CppEmitter emitter;
    header = emitter.Emit(*file, MakeEmitOptions(opts, input_path));
  } catch (const exceptions::SourceError& ex) {
    outcome.status = kExitTranslationError;
    outcome.out = out.str();
    outcome.err = FormatDiagnostic(ex, source_text, color);
    return outcome;
  }

  const std::string target = DeriveOutputPath(opts, input_path);
  if (target == "-") {
    out << header;
  } else {
    std::ostringstream diag;
    if (!WriteFileOrReport(target, header, error_message, diag)) {
      outcome.status = kExitUsageOrIo;
      outcome.err = diag.str();
    }
  }
  outcome.out = out.str();
  return outcome;
}

}  // namespace nestport::driver

/***
 * Name: nestport::main
 * Purpose: Entry point for the nestport transpiler CLI.
 * Inputs:
 *   - argc, argv: Standard process arguments.
 * Outputs:
 *   - int: 0 on success, 1 when an input failed to translate, 2 on usage or I/O errors.
 * Theory of Operation:
 *   Parses flags, enables metrics, translates every input and reports metrics.
 *   Per-file errors are reported by the driver; only failures outside a file's
 *   pipeline reach the handlers here.
 */
#include <exception>
#include <iostream>

#include "nestport/driver/app.h"
#include "nestport/driver/cli.h"
#include "nestport/exceptions/nestport_exception.h"
#include "nestport/metrics/metrics.h"

using nestport::driver::CliOptions;

int main(int argc, char** argv) {
  try {
    using nestport::driver::ParseCli;
    using nestport::driver::PrintUsage;
    CliOptions opts;
    if (!ParseCli(argc, argv, opts, std::cerr)) {
      PrintUsage(std::cerr, argc > 0 ? argv[0] : nullptr);  // NOLINT(*-pro-bounds-pointer-arithmetic)
      return nestport::driver::kExitUsageOrIo;
    }
    if (opts.show_help) {
      PrintUsage(std::cout, argv[0]);  // NOLINT(*-pro-bounds-pointer-arithmetic)
      return nestport::driver::kExitOk;
    }
    nestport::metrics::Metrics::Enable(opts.metrics);
    const int ret_code = nestport::driver::TranspileAll(opts, std::cout, std::cerr);
    nestport::driver::ReportMetricsIfRequested(opts, std::cout);
    return ret_code;
  } catch (const nestport::exceptions::NestportException& ex) {
    std::cerr << "nestport: " << ex.what() << '\n';
    return nestport::driver::kExitUsageOrIo;
  } catch (const std::exception& ex) {
    std::cerr << "nestport: internal error: " << ex.what() << '\n';
    return nestport::driver::kExitUsageOrIo;
  }
}

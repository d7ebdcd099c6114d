/***
 * Name: nestport::driver::DeriveOutputPath
 * Purpose: Compute where the header generated for one input goes.
 * Inputs:
 *   - opts: CLI options (-o, --out-dir)
 *   - input_path: source file path
 * Outputs:
 *   - Destination path; "-" means stdout
 */
#include "nestport/driver/app.h"

#include <filesystem>
#include <string>

namespace nestport::driver {

auto DeriveOutputPath(const driver::CliOptions& opts, const std::string& input_path) -> std::string {
  if (!opts.output.empty()) {
    return opts.output;
  }
  std::filesystem::path target(input_path);
  target.replace_extension(".h");
  if (!opts.out_dir.empty()) {
    return (std::filesystem::path(opts.out_dir) / target.filename()).string();
  }
  return target.string();
}

}  // namespace nestport::driver

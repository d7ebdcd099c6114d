/***
 * Name: nestport::driver::MakeEmitOptions
 * Purpose: Build per-file EmitOptions from the CLI.
 */
#include "nestport/driver/app.h"

#include <string>

namespace nestport::driver {

auto MakeEmitOptions(const driver::CliOptions& opts, const std::string& input_path) -> emit::EmitOptions {
  emit::EmitOptions options{};
  options.knownExternalTypes.insert(opts.known_types.begin(), opts.known_types.end());
  options.sourceName = input_path;
  return options;
}

}  // namespace nestport::driver

/***
 * Name: nestport::driver::UseColor
 * Purpose: Decide whether diagnostics are colorized.
 */
#include "nestport/driver/app.h"

namespace nestport::driver {

auto UseColor(const driver::CliOptions& opts) -> bool {
  switch (opts.color) {
    case CliOptions::ColorMode::Always: return true;
    case CliOptions::ColorMode::Never: return false;
    case CliOptions::ColorMode::Auto: return UseEnvColor();
  }
  return false;
}

}  // namespace nestport::driver

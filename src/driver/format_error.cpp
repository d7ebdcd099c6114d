/***
 * Name: nestport::driver::FormatError
 * Purpose: Render an error that has no source location.
 */
#include "nestport/driver/diagnostics.h"

#include <string>
#include <string_view>

namespace nestport::driver {

auto FormatError(std::string_view message, bool color) -> std::string {
  std::string out{"nestport: "};
  if (color) {
    out += "\033[31merror: \033[0m";
  } else {
    out += "error: ";
  }
  out += message;
  out += '\n';
  return out;
}

}  // namespace nestport::driver

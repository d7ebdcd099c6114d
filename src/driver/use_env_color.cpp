/***
 * Name: nestport::driver::UseEnvColor
 * Purpose: Read NESTPORT_COLOR; 1, true and yes (case-insensitive) enable color.
 */
#include "nestport/driver/app.h"

#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <string_view>

namespace nestport::driver {

static bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) { return false; }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    const auto lhs_ch = static_cast<unsigned char>(lhs[i]);
    const auto rhs_ch = static_cast<unsigned char>(rhs[i]);
    if (std::tolower(lhs_ch) != std::tolower(rhs_ch)) { return false; }
  }
  return true;
}

auto UseEnvColor() -> bool {
  const char* env_value = std::getenv("NESTPORT_COLOR");
  if (env_value == nullptr) { return false; }
  const std::string_view value{env_value, std::strlen(env_value)};
  return value == "1" || EqualsIgnoreCase(value, "true") || EqualsIgnoreCase(value, "yes");
}

}  // namespace nestport::driver

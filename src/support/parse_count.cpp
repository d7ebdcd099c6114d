/***
 * Name: nestport::support::ParseCount
 * Purpose: Parse a positive integer option value.
 * Inputs:
 *   - text: option value as typed by the user
 * Outputs:
 *   - out_val: parsed count on success (left untouched on failure)
 *   - err: optional error message on failure
 * Theory of Operation: Manual digit accumulation with an overflow check per step.
 */
#include "nestport/support/parse.h"

#include <cctype>
#include <limits>

namespace nestport::support {

static void SetError(std::string* err, const char* message) {
  if (err != nullptr) {
    *err = message;
  }
}

auto ParseCount(std::string_view text, int& out_val, std::string* err) -> bool {
  if (text.empty()) {
    SetError(err, "expected a number");
    return false;
  }
  long long value = 0;
  for (const char chr : text) {
    if (std::isdigit(static_cast<unsigned char>(chr)) == 0) {
      SetError(err, "invalid character in number");
      return false;
    }
    value = value * 10 + (chr - '0');
    if (value > std::numeric_limits<int>::max()) {
      SetError(err, "number out of range");
      return false;
    }
  }
  if (value == 0) {
    SetError(err, "expected a positive number");
    return false;
  }
  out_val = static_cast<int>(value);
  return true;
}

}  // namespace nestport::support

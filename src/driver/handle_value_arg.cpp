/***
 * Name: nestport::driver::detail::HandleValueArg
 * Purpose: Handle options carrying one value in conjoined or spaced form.
 * Inputs:
 *   - arg: current argument string
 *   - p.opt: option name ("-o", "-j", "--out-dir", ...)
 *   - p.args, p.index, p.argc: argument vector and cursor (advanced when the
 *     value comes from the next argument)
 *   - p.missing_msg: error text when no value follows
 *   - p.err: error stream
 * Outputs: OptResult; on Handled `value` holds the option value
 * Theory of Operation: Short options take the remainder of the argument as
 *   the value (-j4); long options only do so after '=' so that
 *   --out-dirx is not mistaken for --out-dir.
 */
#include "nestport/driver/cli_parse.h"

#include <cstddef>
#include <string>
#include <vector>

namespace nestport {
namespace driver {
namespace detail {

auto HandleValueArg(const std::string& arg, const ValueArgParams& params, std::string& value) -> OptResult {
  if (arg.rfind(params.opt, 0) != 0U) {
    return OptResult::NotMatched;
  }
  if (arg.size() > params.opt.size()) {
    const bool is_long = params.opt.rfind("--", 0) == 0U;
    std::size_t value_start = params.opt.size();
    if (is_long) {
      if (arg[value_start] != '=') {
        return OptResult::NotMatched;
      }
      ++value_start;
    }
    value = arg.substr(value_start);
    return OptResult::Handled;
  }
  if (params.index + 1 >= params.argc) {
    params.err << "nestport: error: " << params.missing_msg << '\n';
    return OptResult::Error;
  }
  ++params.index;
  value = params.args[static_cast<std::size_t>(params.index)];
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace nestport

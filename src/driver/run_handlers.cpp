/***
 * Name: nestport::driver::detail::RunHandlers
 * Purpose: Execute the ordered handler list for argument at 'index'.
 * Inputs: args, index (in/out), argc, dst, err
 * Outputs: OptResult (Error halts, Handled continues)
 * Theory of Operation: Table-driven dispatch; last handler captures unknown/positional.
 *   Value options share HandleValueArg and differ only in where the value goes.
 */
#include "nestport/driver/cli_parse.h"
#include "nestport/driver/cli.h"
#include "nestport/support/parse.h"

#include <array>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace nestport {
namespace driver {
namespace detail {

auto RunHandlers(const std::vector<std::string>& args,
                 int& index,
                 int argc,
                 CliOptions& dst,
                 std::ostream& err) -> OptResult {
  using HandlerFn = std::function<OptResult(int&)>;
  using ApplyFn = std::function<bool(const std::string&)>;

  // Runs HandleValueArg for `opt` and hands a matched value to `apply`
  const auto value_handler = [&](const std::string& opt, const char* missing_msg, ApplyFn apply) {
    return HandlerFn{[&args, &err, argc, opt, missing_msg, apply](int& idx) {
      const std::string& current = args[static_cast<std::size_t>(idx)];
      const ValueArgParams params{opt, args, idx, argc, missing_msg, err};
      std::string value;
      const OptResult result = HandleValueArg(current, params, value);
      if (result != OptResult::Handled) {
        return result;
      }
      return apply(value) ? OptResult::Handled : OptResult::Error;
    }};
  };

  const std::array handlers{
      HandlerFn{[&](int& idx) { return HandleHelpArg(args[static_cast<std::size_t>(idx)], dst); }},
      HandlerFn{[&](int& idx) { return HandleMetricsArg(args[static_cast<std::size_t>(idx)], dst, err); }},
      HandlerFn{[&](int& idx) { return HandleColorArg(args[static_cast<std::size_t>(idx)], dst, err); }},
      value_handler("-o", "missing filename after '-o'",
                    [&](const std::string& value) {
                      dst.output = value;
                      return true;
                    }),
      value_handler("--out-dir", "missing directory after '--out-dir'",
                    [&](const std::string& value) {
                      dst.out_dir = value;
                      return true;
                    }),
      value_handler("--known-type", "missing type name after '--known-type'",
                    [&](const std::string& value) {
                      if (value.empty()) {
                        err << "nestport: error: empty type name after '--known-type'" << '\n';
                        return false;
                      }
                      dst.known_types.push_back(value);
                      return true;
                    }),
      value_handler("-j", "missing job count after '-j'",
                    [&](const std::string& value) {
                      std::string why;
                      if (!support::ParseCount(value, dst.jobs, &why)) {
                        err << "nestport: error: invalid job count '" << value << "': " << why << '\n';
                        return false;
                      }
                      return true;
                    }),
      HandlerFn{[&](int& idx) { return HandleSwitch(args[static_cast<std::size_t>(idx)], dst); }},
      HandlerFn{[&](int& idx) { return HandleEndOfOptions(args, idx, argc, dst); }},
      HandlerFn{[&](int& idx) {
        return HandleUnknownOrPositional(args[static_cast<std::size_t>(idx)], dst, err);
      }},
  };

  for (const auto& handler : handlers) {
    const OptResult result = handler(index);
    if (result != OptResult::NotMatched) {
      return result;
    }
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace nestport

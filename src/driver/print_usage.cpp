/***
 * Name: nestport::driver::PrintUsage
 * Purpose: Print CLI usage information for nestport.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 */
#include "nestport/driver/cli.h"

#include <cstring>
#include <ostream>
#include <string_view>

namespace nestport::driver {

static std::string_view Basename(const char* path) {
  if (path == nullptr || *path == '\0') {
    return std::string_view{"nestport"};
  }
  const char* last_slash = std::strrchr(path, '/');
  return std::string_view(last_slash != nullptr ? last_slash + 1 : path);
}

auto PrintUsage(std::ostream& out, const char* argv0) -> void {
  const std::string_view program_name = Basename(argv0);
  out << "Usage: " << program_name << " [options] file..." << '\n'
      << '\n'
      << "Translate class declarations into C++ headers, one header per input file." << '\n'
      << '\n'
      << "Options:" << '\n'
      << "  -h, --help              Print this help and exit" << '\n'
      << "  -o <file>               Write the header to <file> ('-' for stdout; single input only)" << '\n'
      << "  --out-dir <dir>         Write <stem>.h for every input into <dir>" << '\n'
      << "  -j <n>                  Transpile up to <n> files in parallel (default: 1)" << '\n'
      << "  -k, --keep-going        Continue with remaining files after a failure" << '\n'
      << "  --known-type <name>     Accept <name> as an external base type (repeatable)" << '\n'
      << "  --dump-ast              Print the parsed AST to stdout" << '\n'
      << "  --log-tokens            Print the token stream to stdout" << '\n'
      << "  --color[=auto|always|never]  Colorize diagnostics (auto: NESTPORT_COLOR)" << '\n'
      << "  --metrics[=json|text]   Print a phase timing summary (default: text)" << '\n'
      << "  --                      End of options" << '\n'
      << '\n'
      << "Exit status: 0 success, 1 translation errors, 2 usage or I/O errors." << '\n';
}

}  // namespace nestport::driver

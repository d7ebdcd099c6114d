/***
 * Name: nestport::stages::CppEmitter::Emit
 * Purpose: Lower the AST to a C++ header under the Emit phase timer.
 */
#include "nestport/stages/cpp_emitter.h"

#include <string>

#include "emitter/Emitter.h"

namespace nestport::stages {

auto CppEmitter::Emit(const ast::File& file, const emit::EmitOptions& options) -> std::string {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Emit);
  return emit::Emitter(options).emit(file);
}

}  // namespace nestport::stages

/***
 * Name: nestport::stages::CppEmitter
 * Purpose: Stage class lowering a File AST to C++ header text.
 * Inputs: File AST, EmitOptions
 * Outputs: Header text; EmissionError on failure
 * Theory of Operation: Wraps emit::Emitter under the Emit phase timer.
 */
#pragma once

#include <string>

#include "ast/File.h"
#include "emitter/EmitOptions.h"
#include "nestport/metrics/metrics.h"

namespace nestport {
namespace stages {

class CppEmitter : public metrics::Metrics {
 public:
  std::string Emit(const ast::File& file, const emit::EmitOptions& options);
};

}  // namespace stages
}  // namespace nestport

/***
 * Name: nestport::emit::Emitter
 * Purpose: Lower a File AST to C++ text.
 * Inputs:
 *   - File AST and EmitOptions
 * Outputs:
 *   - Complete C++ header text; EmissionError instead of partial output
 * Theory of Operation:
 *   Builds a LoweringPlan, then writes forward declarations, class definitions
 *   in emission order and out-of-class member definitions. Nested and
 *   anonymous classes are hoisted to namespace scope under their emitted
 *   names; enclosing classes reach them through `using` aliases. Member
 *   bodies stay opaque and are re-emitted by BodyWriter.
 */
#pragma once

#include <string>
#include <utility>
#include "ast/File.h"
#include "emitter/EmitOptions.h"

namespace nestport::emit {

class Emitter {
 public:
  explicit Emitter(EmitOptions options) : options_(std::move(options)) {}

  std::string emit(const ast::File& file) const;

 private:
  EmitOptions options_;
};

} // namespace nestport::emit

/***
 * Name: nestport::stages::Frontend
 * Purpose: Stage class running lexing, grouping and parsing for one source.
 * Inputs: Source text and the name diagnostics should show for it
 * Outputs: File AST and metrics (token count, geometry, per-phase timings)
 * Theory of Operation: Each phase runs under its own ScopedTimer. Errors are
 *   the located exceptions of the phase that failed and propagate unchanged.
 */
#pragma once

#include <memory>
#include <ostream>
#include <string>

#include "ast/File.h"
#include "nestport/metrics/metrics.h"

namespace nestport {
namespace stages {

class Frontend : public metrics::Metrics {
 public:
  /*** Build: Construct the AST; token_log (when set) receives one line per token. */
  std::unique_ptr<ast::File> Build(const std::string& src, const std::string& name, std::ostream* token_log = nullptr);
};

}  // namespace stages
}  // namespace nestport

/***
 * Name: nestport::metrics::Metrics::PhaseName
 * Purpose: Stable display name of a pipeline phase for both report formats.
 */
#include "nestport/metrics/metrics.h"

namespace nestport::metrics {

auto Metrics::PhaseName(Phase phase) -> const char* {
  switch (phase) {
    case Phase::ReadFile: return "ReadFile";
    case Phase::Lex: return "Lex";
    case Phase::Group: return "Group";
    case Phase::Parse: return "Parse";
    case Phase::Emit: return "Emit";
    case Phase::WriteFile: return "WriteFile";
  }
  return "Unknown";
}

}  // namespace nestport::metrics

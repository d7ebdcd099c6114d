/***
 * Name: nestport::metrics::PrintMetricsJson
 * Purpose: Print metrics in JSON for consumption by tools.
 * Inputs:
 *   - reg: metrics registry snapshot
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Simple JSON writer; every duration sample is one object
 *   in recording order. Phase names are fixed identifiers and need no escaping.
 */
#include "nestport/metrics/metrics.h"

#include <cstddef>
#include <ostream>

namespace nestport::metrics {

auto Metrics::PrintMetricsJson(const Registry& reg, std::ostream& out) -> void {
  if (!reg.enabled) {
    return;
  }
  out << "{";
  // durations
  out << "\n  \"durations_ns\": [";
  for (std::size_t i = 0; i < reg.durations_ns.size(); ++i) {
    const auto& item = reg.durations_ns[i];
    out << (i != 0U ? ",\n    {" : "\n    {")
        << R"("phase": ")" << PhaseName(item.first) << R"(", "ns": )" << item.second << "}";
  }
  out << "\n  ],";
  out << "\n  \"tokens\": " << reg.tokens << ",";
  // AST
  out << "\n  \"ast\": { \"nodes\": " << reg.ast_geom.nodes
      << ", \"max_depth\": " << reg.ast_geom.maxDepth << " },";
  // files
  out << "\n  \"files\": { \"ok\": " << reg.files_ok << ", \"failed\": " << reg.files_failed << " }\n}\n";
}

}  // namespace nestport::metrics

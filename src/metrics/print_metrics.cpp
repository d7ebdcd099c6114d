/***
 * Name: nestport::metrics::PrintMetrics
 * Purpose: Pretty-print collected metrics (durations, AST geometry, file counters).
 * Inputs:
 *   - reg: metrics registry snapshot
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Durations are summed per phase and shown in milliseconds
 *   in pipeline order, followed by the counters.
 */
#include "nestport/metrics/metrics.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <ostream>

namespace nestport::metrics {

auto Metrics::PrintMetrics(const Registry& reg, std::ostream& out) -> void {
  if (!reg.enabled) {
    return;
  }
  constexpr std::size_t kPhaseCount = 6;
  std::array<std::uint64_t, kPhaseCount> totals{};
  std::array<std::uint64_t, kPhaseCount> samples{};
  for (const auto& entry : reg.durations_ns) {
    const auto slot = static_cast<std::size_t>(entry.first);
    totals[slot] += entry.second;
    ++samples[slot];
  }
  out << "== Metrics ==\n";
  for (std::size_t slot = 0; slot < kPhaseCount; ++slot) {
    if (samples[slot] == 0U) {
      continue;
    }
    const double milliseconds = static_cast<double>(totals[slot]) / 1'000'000.0;
    out << "  " << PhaseName(static_cast<Phase>(slot)) << ": " << std::fixed << std::setprecision(3)
        << milliseconds << " ms (" << samples[slot] << ")\n";
  }
  out << "  Tokens: " << reg.tokens << "\n";
  out << "  AST: nodes=" << reg.ast_geom.nodes << ", max_depth=" << reg.ast_geom.maxDepth << "\n";
  out << "  Files: ok=" << reg.files_ok << ", failed=" << reg.files_failed << "\n";
}

}  // namespace nestport::metrics

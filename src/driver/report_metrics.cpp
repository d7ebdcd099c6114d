/***
 * Name: nestport::driver::ReportMetricsIfRequested
 * Purpose: Print the run's metrics summary after all files are done (--metrics).
 * Theory of Operation: Snapshots the registry once so the text and JSON
 *   renderers see the same counters even if workers were still recording.
 */
#include "nestport/driver/app.h"
#include "nestport/metrics/metrics.h"

#include <ostream>

namespace nestport::driver {

auto ReportMetricsIfRequested(const driver::CliOptions& opts, std::ostream& out) -> void {
  if (!opts.metrics) {
    return;
  }
  const metrics::Metrics::Registry snapshot = metrics::Metrics::GetRegistry();
  switch (opts.metrics_format) {
    case driver::CliOptions::MetricsFormat::Json:
      metrics::Metrics::PrintMetricsJson(snapshot, out);
      break;
    case driver::CliOptions::MetricsFormat::Text:
      metrics::Metrics::PrintMetrics(snapshot, out);
      break;
  }
}

}  // namespace nestport::driver

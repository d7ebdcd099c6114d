/***
 * Name: nestport::metrics::Metrics::reg_
 * Purpose: Define the static metrics registry storage and its lock.
 * Inputs: N/A
 * Outputs: Singleton-style storage for metrics across stages and workers.
 * Theory of Operation: One definition for each declared static member.
 */
#include "nestport/metrics/metrics.h"

#include <mutex>

namespace nestport {
namespace metrics {

std::mutex Metrics::mu_{};
Metrics::Registry Metrics::reg_{};

}  // namespace metrics
}  // namespace nestport

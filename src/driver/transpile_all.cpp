/***
 * Name: nestport::driver::TranspileAll
 * Purpose: Translate every input file, optionally in parallel.
 * Inputs:
 *   - opts: CLI options (inputs, jobs, keep_going)
 *   - out, err: destinations for buffered per-file output and diagnostics
 * Outputs:
 *   - int: highest status of the files that ran (0, 1 or 2)
 * Theory of Operation: Files share no state, so each worker runs TranspileOnce
 *   on the next unclaimed input. Outcomes are stored by input index and
 *   printed after the join, which keeps the report order independent of
 *   scheduling. A worker never lets an exception escape its thread; anything
 *   TranspileOnce does not classify is recorded as an internal error.
 */
#include "nestport/driver/app.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "nestport/driver/diagnostics.h"
#include "nestport/exceptions/nestport_exception.h"
#include "nestport/metrics/metrics.h"

namespace nestport::driver {

static FileOutcome RunGuarded(const driver::CliOptions& opts, const std::string& input_path) {
  try {
    return TranspileOnce(opts, input_path);
  } catch (const exceptions::NestportException& ex) {
    return FileOutcome{kExitUsageOrIo, {}, FormatError(input_path + ": " + ex.what(), UseColor(opts))};
  } catch (const std::exception& ex) {
    return FileOutcome{kExitUsageOrIo, {},
                       FormatError(input_path + ": internal error: " + ex.what(), UseColor(opts))};
  }
}

auto TranspileAll(const driver::CliOptions& opts, std::ostream& out, std::ostream& err) -> int {
  const std::size_t count = opts.inputs.size();
  std::vector<std::optional<FileOutcome>> outcomes(count);
  std::atomic<std::size_t> next{0};
  std::atomic<bool> stop{false};

  const auto worker = [&]() {
    while (!stop.load()) {
      const std::size_t index = next.fetch_add(1);
      if (index >= count) {
        return;
      }
      FileOutcome outcome = RunGuarded(opts, opts.inputs[index]);
      metrics::Metrics::CountFile(outcome.status == kExitOk);
      if (outcome.status != kExitOk && !opts.keep_going) {
        stop.store(true);
      }
      outcomes[index] = std::move(outcome);
    }
  };

  const auto workers = std::min<std::size_t>(static_cast<std::size_t>(std::max(opts.jobs, 1)), count);
  if (workers <= 1) {
    worker();
  } else {
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
      pool.emplace_back(worker);
    }
    for (auto& thread : pool) {
      thread.join();
    }
  }

  int status = kExitOk;
  for (const auto& outcome : outcomes) {
    if (!outcome) {
      continue;  // not started after an earlier failure
    }
    out << outcome->out;
    err << outcome->err;
    status = std::max(status, outcome->status);
  }
  out.flush();
  return status;
}

}  // namespace nestport::driver

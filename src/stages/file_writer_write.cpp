/***
 * Name: nestport::stages::FileWriter::Write
 * Purpose: Write a generated header and record metrics for the WriteFile phase.
 */
#include "nestport/stages/file_writer.h"

#include "nestport/metrics/metrics.h"
#include "nestport/support/fs.h"

#include <string>

namespace nestport::stages {

auto FileWriter::Write(const std::string& path, const std::string& data, std::string& err) -> bool {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::WriteFile);
  return support::WriteFile(path, data, err);
}

}  // namespace nestport::stages

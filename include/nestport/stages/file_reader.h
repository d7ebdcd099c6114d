/***
 * Name: nestport::stages::FileReader
 * Purpose: Load one Java-shaped compilation unit before lexing.
 * Inputs: Path named on the command line
 * Outputs: Whole file text, or the IO message the driver prints with exit status 2
 * Theory of Operation: The read is timed as the ReadFile phase. Directories and
 *   unreadable paths are reported through `err`, never thrown.
 */
#pragma once

#include <string>

#include "nestport/metrics/metrics.h"

namespace nestport {
namespace stages {

class FileReader : public metrics::Metrics {
 public:
  static bool Read(const std::string& path, std::string& source, std::string& err);
};

}  // namespace stages
}  // namespace nestport

/***
 * Name: nestport::stages::FileWriter
 * Purpose: Stage class for writing a generated header.
 * Inputs: Filesystem path and header text
 * Outputs: File on disk
 * Theory of Operation: Wraps support::WriteFile and instruments metrics via RAII.
 */
#pragma once

#include <string>

#include "nestport/metrics/metrics.h"

namespace nestport {
namespace stages {

class FileWriter : public metrics::Metrics {
 public:
  static bool Write(const std::string& path, const std::string& data, std::string& err);
};

}  // namespace stages
}  // namespace nestport

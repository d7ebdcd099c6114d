/***
 * Name: nestport::stages::FileReader::Read
 * Purpose: Timed wrapper over support::ReadFile for translation inputs.
 */
#include "nestport/stages/file_reader.h"

#include "nestport/support/fs.h"

namespace nestport::stages {

bool FileReader::Read(const std::string& path, std::string& source, std::string& err) {
  const ScopedTimer timer(Phase::ReadFile);
  return support::ReadFile(path, source, err);
}

}  // namespace nestport::stages

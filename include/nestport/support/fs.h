/***
 * Name: nestport::support (fs)
 * Purpose: Minimal file IO helpers for reading sources and writing generated headers.
 * Inputs: Paths and string buffers
 * Outputs: File contents to/from disk
 * Theory of Operation: Thin wrappers over fstream and std::filesystem to
 *   centralize error handling; failures are reported through err, never thrown.
 */
#pragma once

#include <string>

namespace nestport {
namespace support {

/*** ReadFile: Read entire file into out. Return true on success. */
bool ReadFile(const std::string& path, std::string& out, std::string& err);

/*** WriteFile: Write entire string to path, creating missing parent directories. */
bool WriteFile(const std::string& path, const std::string& data, std::string& err);

}  // namespace support
}  // namespace nestport

/***
 * Name: nestport::exceptions::FileReadError
 * Purpose: Exception for filesystem read failures.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from NestportException.
 */
#pragma once

#include "nestport/exceptions/nestport_exception.h"

namespace nestport {
namespace exceptions {

class FileReadError : public NestportException {
 public:
  explicit FileReadError(std::string msg) noexcept : NestportException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace nestport

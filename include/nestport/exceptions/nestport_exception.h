/***
 * Name: nestport::exceptions::NestportException
 * Purpose: Base class for all nestport exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in nestport must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>
#include <utility>

namespace nestport {
namespace exceptions {

class NestportException : public std::exception {
 public:
  virtual ~NestportException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit NestportException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace nestport

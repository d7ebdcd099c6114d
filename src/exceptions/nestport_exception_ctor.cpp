/***
 * Name: nestport::exceptions::NestportException::NestportException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "nestport/exceptions/nestport_exception.h"

namespace nestport {
namespace exceptions {

NestportException::NestportException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace nestport

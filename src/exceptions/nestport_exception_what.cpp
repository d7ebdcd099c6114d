/***
 * Name: nestport::exceptions::NestportException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "nestport/exceptions/nestport_exception.h"

namespace nestport::exceptions {

const char* NestportException::what() const noexcept { return message_.c_str(); }

}  // namespace nestport::exceptions

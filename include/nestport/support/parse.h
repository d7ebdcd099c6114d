/***
 * Name: nestport::support::ParseCount
 * Purpose: Parse a strictly positive base-10 count (worker counts and similar) without throwing.
 * Inputs: Text of digits only; optional error out
 * Outputs: Parsed value via out_val; returns true on success
 * Theory of Operation: Rejects signs, whitespace, zero and values above int range.
 */
#pragma once

#include <string>
#include <string_view>

namespace nestport {
namespace support {

bool ParseCount(std::string_view text, int& out_val, std::string* err = nullptr);

}  // namespace support
}  // namespace nestport

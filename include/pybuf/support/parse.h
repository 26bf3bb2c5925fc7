/***
 * Name: pybuf::support (parse)
 * Purpose: Parse small configuration values read from the environment without throwing.
 * Inputs: Raw text of an environment variable; optional error out
 * Outputs: Parsed value via out parameter; returns true on success
 * Theory of Operation: Manual character scanning; surrounding whitespace is ignored,
 *   anything else that does not belong to the value is rejected.
 */
#pragma once

#include <string>
#include <string_view>

namespace pybuf {
namespace support {

/*** ParseLevel: Parse a non-negative base-10 level (e.g. a debug verbosity). */
bool ParseLevel(std::string_view text, int& out_val, std::string* err = nullptr);

/*** TrimSpaces: Strip leading and trailing whitespace. */
std::string_view TrimSpaces(std::string_view text);

}  // namespace support
}  // namespace pybuf

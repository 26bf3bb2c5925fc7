/***
 * Name: pybuf::support::ParseLevel
 * Purpose: Parse a non-negative base-10 level; fail on signs, junk or overflow.
 * Inputs:
 *   - text: raw value (surrounding whitespace allowed)
 * Outputs:
 *   - out_val: parsed level on success
 *   - err: optional error message on failure
 * Theory of Operation: Manual digit parsing with a range check.
 */
#include "pybuf/support/parse.h"

#include <cctype>
#include <limits>

namespace pybuf::support {

auto ParseLevel(std::string_view text, int& out_val, std::string* err) -> bool {
  text = TrimSpaces(text);
  if (text.empty()) {
    if (err != nullptr) {
      *err = "empty level";
    }
    return false;
  }
  long long value = 0;
  for (char ch : text) {
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
      if (err != nullptr) {
        *err = "invalid character in level";
      }
      return false;
    }
    value = value * 10 + (ch - '0');
    if (value > std::numeric_limits<int>::max()) {
      if (err != nullptr) {
        *err = "level overflow";
      }
      return false;
    }
  }
  out_val = static_cast<int>(value);
  return true;
}

}  // namespace pybuf::support

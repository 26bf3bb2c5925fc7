/***
 * Name: pybuf::support::TrimSpaces
 * Purpose: Strip leading and trailing whitespace from a view.
 * Inputs:
 *   - text: view to trim
 * Outputs: Sub-view of text without surrounding whitespace
 * Theory of Operation: Advances both ends while std::isspace holds.
 */
#include "pybuf/support/parse.h"

#include <cctype>

namespace pybuf::support {

auto TrimSpaces(std::string_view text) -> std::string_view {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace pybuf::support

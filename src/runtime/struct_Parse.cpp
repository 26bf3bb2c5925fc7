/**
 * @file
 * @brief struct_parse_format: parse struct-style format labels.
 */
#include "runtime/detail/StructFormat.h"
#include <cctype>

namespace pybuf::rt::detail {

// Repeat counts above this are rejected rather than overflowing.
static constexpr int kMaxRepeat = 1 << 24;

std::size_t struct_code_width(char code) {
  switch (code) {
    case 'b': case 'B': case 'c': case '?': return 1;
    case 'h': case 'H': return 2;
    case 'i': case 'I': case 'l': case 'L': case 'f': return 4;
    case 'q': case 'Q': case 'd': return 8;
    default: return 0;
  }
}

bool struct_parse_format(std::string_view fmt, std::vector<StructItem>& out, bool& little) {
  little = true;
  std::size_t i = 0;
  const std::size_t n = fmt.size();
  if (i < n && (fmt[i] == '<' || fmt[i] == '>' || fmt[i] == '=' || fmt[i] == '!')) {
    little = (fmt[i] == '<' || fmt[i] == '=');
    ++i;
  }
  while (i < n) {
    int count = 0;
    bool explicitCount = false;
    while (i < n && std::isdigit(static_cast<unsigned char>(fmt[i]))) {
      if (count > kMaxRepeat / 10) return false;
      count = count * 10 + (fmt[i] - '0');
      explicitCount = true;
      ++i;
    }
    if (!explicitCount) count = 1;
    if (i >= n) return false;
    const char c = fmt[i++];
    if (struct_code_width(c) == 0) return false;
    out.push_back(StructItem{c, count});
  }
  return true;
}

std::optional<std::size_t> struct_itemsize(std::string_view fmt) {
  std::vector<StructItem> items;
  bool little = true;
  if (fmt.empty() || !struct_parse_format(fmt, items, little)) return std::nullopt;
  return struct_calcsize_impl(items);
}

} // namespace pybuf::rt::detail

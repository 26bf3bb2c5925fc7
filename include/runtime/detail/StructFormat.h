/**
 * @file
 * @brief Struct-style format labels: parsing and size computation.
 *
 * Providers that describe typed elements (Array) use these to turn a format
 * label such as "i" or "<2h" into an itemsize. The buffer protocol itself only
 * forwards the label.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace pybuf::rt::detail {

// Parsed struct item (code and repetition count)
struct StructItem { char code; int count; };

// Standard size of a single code; 0 for codes this runtime does not know.
std::size_t struct_code_width(char code);

// Parse `fmt` (optional '<', '>', '=' or '!' prefix, then [count]code...) into `out`.
// Returns false on unknown codes or a trailing count without a code.
bool struct_parse_format(std::string_view fmt, std::vector<StructItem>& out, bool& little);

// Total byte size of the parsed items using standard sizes.
std::size_t struct_calcsize_impl(const std::vector<StructItem>& items);

// Convenience: parse then size; nothing when the label is malformed.
std::optional<std::size_t> struct_itemsize(std::string_view fmt);

} // namespace pybuf::rt::detail

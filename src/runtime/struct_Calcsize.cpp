/**
 * @file
 * @brief struct_calcsize_impl: compute size from parsed struct items.
 */
#include "runtime/detail/StructFormat.h"

namespace pybuf::rt::detail {

std::size_t struct_calcsize_impl(const std::vector<StructItem>& items) {
  std::size_t need = 0;
  for (const auto& it : items) {
    need += static_cast<std::size_t>(it.count) * struct_code_width(it.code);
  }
  return need;
}

} // namespace pybuf::rt::detail

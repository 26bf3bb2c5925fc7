/***
 * Name: pybuf::buffer::BufferDescriptor::fastPosition, position
 * Purpose: Map an index tuple to the byte offset of its element.
 * Inputs:
 *   - indices: one index per dimension, outermost first
 * Outputs: Byte offset relative to the start of provider storage
 * Theory of Operation: Dot product of indices with strides plus every suboffset.
 *   position() first wraps negative indices (i + shape) and rejects anything
 *   still outside [0, shape) with IndexError naming the 1-based dimension.
 */
#include "buffer/BufferDescriptor.h"
#include "pybuf/exceptions/index_error.h"

#include <cassert>

namespace pybuf::buffer {

std::ptrdiff_t BufferDescriptor::fastPosition(const std::vector<std::size_t>& indices) const {
  assert(indices.size() == dims_.size() && "index count must match ndim");
  std::ptrdiff_t pos = 0;
  for (std::size_t k = 0; k < dims_.size(); ++k) {
    pos += static_cast<std::ptrdiff_t>(indices[k]) * dims_[k].stride + dims_[k].suboffset;
  }
  return pos;
}

std::ptrdiff_t BufferDescriptor::position(const std::vector<std::ptrdiff_t>& indices) const {
  assert(indices.size() == dims_.size() && "index count must match ndim");
  std::ptrdiff_t pos = 0;
  for (std::size_t k = 0; k < dims_.size(); ++k) {
    const DimDesc& d = dims_[k];
    const std::ptrdiff_t raw = indices[k];
    const auto extent = static_cast<std::ptrdiff_t>(d.shape);
    const std::ptrdiff_t wrapped = raw < 0 ? raw + extent : raw;
    if (wrapped < 0 || wrapped >= extent) {
      throw exceptions::IndexError("index out of bounds on dimension " + std::to_string(k + 1) + " (index " +
                                   std::to_string(raw) + ")");
    }
    pos += wrapped * d.stride + d.suboffset;
  }
  return pos;
}

}  // namespace pybuf::buffer

/***
 * Name: pybuf::buffer::BufferDescriptor (contiguity)
 * Purpose: Classify a layout as row-major contiguous or not.
 * Theory of Operation:
 *   Walk dimensions innermost to outermost with an expected stride starting at
 *   itemsize; every dimension with more than one element must match it, then the
 *   expectation grows by the shape. Dimensions of extent 0 or 1 never break
 *   contiguity, and an empty buffer is contiguous.
 */
#include "buffer/BufferDescriptor.h"

namespace pybuf::buffer {

bool BufferDescriptor::isContiguous() const {
  if (len_ == 0) { return true; }
  auto expected = static_cast<std::ptrdiff_t>(itemsize_);
  for (auto it = dims_.rbegin(); it != dims_.rend(); ++it) {
    if (it->shape > 1 && it->stride != expected) { return false; }
    expected *= static_cast<std::ptrdiff_t>(it->shape);
  }
  return true;
}

bool BufferDescriptor::isLastDimContiguous() const {
  if (dims_.empty()) { return false; }
  const DimDesc& last = dims_.back();
  return last.suboffset == 0 && last.stride == static_cast<std::ptrdiff_t>(itemsize_);
}

bool BufferDescriptor::isZeroInShape() const {
  for (const auto& d : dims_) {
    if (d.shape == 0) { return true; }
  }
  return false;
}

bool BufferDescriptor::hasSuboffsets() const {
  for (const auto& d : dims_) {
    if (d.suboffset != 0) { return true; }
  }
  return false;
}

}  // namespace pybuf::buffer

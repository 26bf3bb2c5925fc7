/***
 * Name: pybuf::buffer::BufferDescriptor::checkInvariants, validate
 * Purpose: Check descriptor invariants; treat violations as fatal programming errors.
 * Inputs: none (operates on *this)
 * Outputs: Violation text (checkInvariants) or *this (validate)
 * Theory of Operation:
 *   Invariants: itemsize != 0, ndim >= 1, every stride != 0, every suboffset >= 0,
 *   product(shape) * itemsize == len. Descriptors come from trusted producers, so
 *   validate() only checks when rt::validation_enabled() says so and aborts on
 *   the first violation after reporting it on stderr.
 */
#include "buffer/BufferDescriptor.h"
#include "runtime/Config.h"

#include <cstdio>
#include <cstdlib>

namespace pybuf::buffer {

std::optional<std::string> BufferDescriptor::checkInvariants() const {
  if (itemsize_ == 0) { return std::string("itemsize must be non-zero"); }
  if (dims_.empty()) { return std::string("descriptor must have at least one dimension"); }
  std::size_t shapeProduct = 1;
  for (std::size_t i = 0; i < dims_.size(); ++i) {
    const DimDesc& d = dims_[i];
    if (d.stride == 0) { return "stride of dimension " + std::to_string(i) + " is zero"; }
    if (d.suboffset < 0) { return "suboffset of dimension " + std::to_string(i) + " is negative"; }
    shapeProduct *= d.shape;
  }
  if (shapeProduct * itemsize_ != len_) {
    return "shape product " + std::to_string(shapeProduct) + " * itemsize " + std::to_string(itemsize_) +
           " does not match len " + std::to_string(len_);
  }
  return std::nullopt;
}

const BufferDescriptor& BufferDescriptor::validate() const {
  if (!rt::validation_enabled()) { return *this; }
  if (auto violation = checkInvariants()) {
    std::fprintf(stderr, "[runtime] invalid buffer descriptor: %s\n", violation->c_str());
    std::abort();
  }
  return *this;
}

}  // namespace pybuf::buffer

/***
 * Name: pybuf::buffer::BufferDescriptor (construction)
 * Purpose: Constructors, factories and value transformations for descriptors.
 * Theory of Operation: Plain member-wise construction; factories build the
 *   1-D layouts providers use most. Transformations copy and adjust.
 */
#include "buffer/BufferDescriptor.h"

namespace pybuf::buffer {

BufferDescriptor::BufferDescriptor(std::size_t len, bool readonly, std::size_t itemsize, std::string format,
                                   std::vector<DimDesc> dims)
    : len_(len), readonly_(readonly), itemsize_(itemsize), format_(std::move(format)), dims_(std::move(dims)) {}

BufferDescriptor BufferDescriptor::simple(std::size_t bytesLen, bool readonly) {
  return BufferDescriptor(bytesLen, readonly, 1, "B", {DimDesc{bytesLen, 1, 0}});
}

BufferDescriptor BufferDescriptor::format(std::size_t bytesLen, bool readonly, std::size_t itemsize,
                                          std::string format) {
  // itemsize 0 is rejected by validate(); avoid dividing by it here
  const std::size_t count = itemsize == 0 ? 0 : bytesLen / itemsize;
  return BufferDescriptor(bytesLen, readonly, itemsize, std::move(format),
                          {DimDesc{count, static_cast<std::ptrdiff_t>(itemsize), 0}});
}

BufferDescriptor BufferDescriptor::asReadonly() const {
  BufferDescriptor copy = *this;
  copy.readonly_ = true;
  return copy;
}

std::vector<std::size_t> BufferDescriptor::shape() const {
  std::vector<std::size_t> out;
  out.reserve(dims_.size());
  for (const auto& d : dims_) { out.push_back(d.shape); }
  return out;
}

bool BufferDescriptor::sameShape(const BufferDescriptor& other) const {
  if (dims_.size() != other.dims_.size()) { return false; }
  for (std::size_t i = 0; i < dims_.size(); ++i) {
    if (dims_[i].shape != other.dims_[i].shape) { return false; }
  }
  return true;
}

}  // namespace pybuf::buffer

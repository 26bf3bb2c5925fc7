/***
 * Name: pybuf::rt::VecBuffer
 * Purpose: Default provider implementation and its method table.
 */
#include "runtime/VecBuffer.h"

#include <mutex>
#include <utility>

namespace pybuf::rt {

const TypeObject& vec_buffer_type() {
  static const TypeObject type{"vec_buffer", &object_type(), TypeTag::VecBuffer, nullptr};
  return type;
}

VecBuffer::VecBuffer(std::vector<unsigned char> data) : Object(vec_buffer_type()), data_(std::move(data)) {}

std::vector<unsigned char> VecBuffer::take() {
  const std::unique_lock<std::shared_mutex> lock(mu_);
  std::vector<unsigned char> out;
  out.swap(data_);
  return out;
}

void VecBuffer::append(std::span<const unsigned char> bytes) {
  const std::unique_lock<std::shared_mutex> lock(mu_);
  data_.insert(data_.end(), bytes.begin(), bytes.end());
}

std::size_t VecBuffer::size() const {
  const std::shared_lock<std::shared_mutex> lock(mu_);
  return data_.size();
}

buffer::BorrowedBytes VecBuffer::borrow() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return {data_.data(), data_.size(), std::move(lock)};
}

buffer::BorrowedBytesMut VecBuffer::borrowMut() {
  std::unique_lock<std::shared_mutex> lock(mu_);
  return {data_.data(), data_.size(), std::move(lock)};
}

static const buffer::BufferMethods kVecBufferMethods{
    [](Object& obj) { return static_cast<const VecBuffer&>(obj).borrow(); },
    [](Object& obj) { return static_cast<VecBuffer&>(obj).borrowMut(); },
    [](Object&) {},
    [](Object&) {},
};

const buffer::BufferMethods& VecBuffer::methods() { return kVecBufferMethods; }

buffer::ManagedBuffer VecBuffer::intoBuffer(std::shared_ptr<VecBuffer> self, bool readonly) {
  const std::size_t len = self->size();
  return buffer::ManagedBuffer(std::move(self), buffer::BufferDescriptor::simple(len, readonly), kVecBufferMethods);
}

buffer::ManagedBuffer VecBuffer::intoBufferWithDescriptor(std::shared_ptr<VecBuffer> self,
                                                          buffer::BufferDescriptor desc) {
  return buffer::ManagedBuffer(std::move(self), std::move(desc), kVecBufferMethods);
}

} // namespace pybuf::rt

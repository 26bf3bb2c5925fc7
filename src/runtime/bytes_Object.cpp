/***
 * Name: pybuf::rt::Bytes
 * Purpose: Immutable provider implementation, buffer slot and method table.
 */
#include "runtime/Bytes.h"
#include "runtime/VecBuffer.h"
#include "pybuf/exceptions/buffer_error.h"

#include <utility>

namespace pybuf::rt {

static buffer::ManagedBuffer bytes_as_buffer(const std::shared_ptr<Object>& obj);

const TypeObject& bytes_type() {
  static const TypeObject type{"bytes", &object_type(), TypeTag::Bytes, &bytes_as_buffer};
  return type;
}

static const buffer::BufferMethods kBytesMethods{
    [](Object& obj) {
      const auto& self = static_cast<const Bytes&>(obj);
      return buffer::BorrowedBytes(self.data(), self.size());
    },
    [](Object&) -> buffer::BorrowedBytesMut {
      throw exceptions::BufferError("bytes object is not writable");
    },
    [](Object&) {},
    [](Object&) {},
};

static buffer::ManagedBuffer bytes_as_buffer(const std::shared_ptr<Object>& obj) {
  const auto& self = static_cast<const Bytes&>(*obj);
  return buffer::ManagedBuffer(obj, buffer::BufferDescriptor::simple(self.size(), true), kBytesMethods);
}

Bytes::Bytes(std::vector<unsigned char> data, const TypeObject& type) : Object(type), data_(std::move(data)) {}

std::shared_ptr<Bytes> Bytes::create(std::vector<unsigned char> data) {
  return std::make_shared<Bytes>(std::move(data));
}

std::shared_ptr<Bytes> Bytes::fromVecBuffer(VecBuffer& source) { return create(source.take()); }

const buffer::BufferMethods& Bytes::methods() { return kBytesMethods; }

} // namespace pybuf::rt

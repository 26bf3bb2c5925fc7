/***
 * Name: pybuf::buffer::ManagedBuffer::fromObject, fromByteVector
 * Purpose: Obtain a buffer for an arbitrary object, or for freshly produced bytes.
 * Inputs:
 *   - obj: any runtime object (fromObject)
 *   - bytes: owned byte vector (fromByteVector)
 * Outputs: A new export
 * Theory of Operation: fromObject walks the object's type chain for the first
 *   registered buffer slot and raises TypeError when there is none.
 */
#include "buffer/ManagedBuffer.h"
#include "pybuf/exceptions/type_error.h"
#include "runtime/Object.h"
#include "runtime/VecBuffer.h"

namespace pybuf::buffer {

ManagedBuffer ManagedBuffer::fromObject(const std::shared_ptr<rt::Object>& obj) {
  const rt::AsBufferSlot slot = obj->type().findAsBuffer();
  if (slot == nullptr) {
    throw exceptions::TypeError("a bytes-like object is required, not '" + obj->type().name + "'");
  }
  return slot(obj);
}

ManagedBuffer ManagedBuffer::fromByteVector(std::vector<unsigned char> bytes) {
  return rt::VecBuffer::intoBuffer(std::make_shared<rt::VecBuffer>(std::move(bytes)), true);
}

}  // namespace pybuf::buffer

/***
 * Name: pybuf::rt::ByteArray
 * Purpose: Mutable byte array operations and its buffer slot.
 */
#include "runtime/ByteArray.h"
#include "pybuf/exceptions/index_error.h"
#include "pybuf/exceptions/value_error.h"

#include <utility>

namespace pybuf::rt {

static buffer::ManagedBuffer bytearray_as_buffer(const std::shared_ptr<Object>& obj) {
  return ResizableBytes::exportView(obj, [](std::size_t len) { return buffer::BufferDescriptor::simple(len, false); });
}

const TypeObject& bytearray_type() {
  static const TypeObject type{"bytearray", &object_type(), TypeTag::ByteArray, &bytearray_as_buffer};
  return type;
}

ByteArray::ByteArray(std::vector<unsigned char> data, const TypeObject& type) : ResizableBytes(type, std::move(data)) {}

std::shared_ptr<ByteArray> ByteArray::create(std::vector<unsigned char> data) {
  return std::make_shared<ByteArray>(std::move(data));
}

static std::size_t wrap_index(std::ptrdiff_t index, std::size_t len) {
  const auto n = static_cast<std::ptrdiff_t>(len);
  const std::ptrdiff_t i = index < 0 ? index + n : index;
  if (i < 0 || i >= n) { throw exceptions::IndexError("bytearray index out of range"); }
  return static_cast<std::size_t>(i);
}

int ByteArray::get(std::ptrdiff_t index) const {
  const buffer::BorrowedBytes bytes = borrow();
  return static_cast<int>(bytes[wrap_index(index, bytes.size())]);
}

void ByteArray::set(std::ptrdiff_t index, int value) {
  if (value < 0 || value > 255) { throw exceptions::ValueError("byte must be in range(0, 256)"); }
  const buffer::BorrowedBytesMut bytes = borrowMut();
  bytes[wrap_index(index, bytes.size())] = static_cast<unsigned char>(value);
}

void ByteArray::append(int value) {
  if (value < 0 || value > 255) { throw exceptions::ValueError("byte must be in range(0, 256)"); }
  auto permit = tryResizable();
  permit->push_back(static_cast<unsigned char>(value));
}

void ByteArray::extend(const buffer::ManagedBuffer& src) {
  // Collect before locking: src may be a view of another provider.
  std::vector<unsigned char> incoming;
  src.appendTo(incoming);
  auto permit = tryResizable();
  permit->insert(permit->end(), incoming.begin(), incoming.end());
}

void ByteArray::resize(std::size_t n) {
  auto permit = tryResizable();
  permit->resize(n, 0);
}

void ByteArray::clear() {
  auto permit = tryResizable();
  permit->clear();
}

buffer::ManagedBuffer ByteArray::exportReadonly(const std::shared_ptr<ByteArray>& self) {
  return exportView(self, [](std::size_t len) { return buffer::BufferDescriptor::simple(len, true); });
}

} // namespace pybuf::rt

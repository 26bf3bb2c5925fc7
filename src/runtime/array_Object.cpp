/***
 * Name: pybuf::rt::Array
 * Purpose: Typed array construction, element appends and its buffer slot.
 */
#include "runtime/Array.h"
#include "runtime/detail/StructFormat.h"
#include "pybuf/exceptions/value_error.h"

#include <string>
#include <string_view>

namespace pybuf::rt {

static constexpr std::string_view kTypecodes = "bBhHiIlLqQfd";

static buffer::ManagedBuffer array_as_buffer(const std::shared_ptr<Object>& obj) {
  const auto& self = static_cast<const Array&>(*obj);
  return ResizableBytes::exportView(obj, [&self](std::size_t len) {
    return buffer::BufferDescriptor::format(len, false, self.itemsize(), std::string(1, self.typecode()));
  });
}

const TypeObject& array_type() {
  static const TypeObject type{"array.array", &object_type(), TypeTag::Array, &array_as_buffer};
  return type;
}

Array::Array(char typecode, std::size_t itemsize, const TypeObject& type)
    : ResizableBytes(type, {}), typecode_(typecode), itemsize_(itemsize) {}

std::shared_ptr<Array> Array::create(char typecode) {
  const auto itemsize = detail::struct_itemsize(std::string_view(&typecode, 1));
  if (kTypecodes.find(typecode) == std::string_view::npos || !itemsize) {
    throw exceptions::ValueError("bad typecode (must be b, B, h, H, i, I, l, L, q, Q, f or d)");
  }
  return std::make_shared<Array>(typecode, *itemsize);
}

void Array::appendRaw(const void* item) {
  const auto* p = static_cast<const unsigned char*>(item);
  auto permit = tryResizable();
  permit->insert(permit->end(), p, p + itemsize_);
}

void Array::frombytes(const buffer::ManagedBuffer& src) {
  std::vector<unsigned char> incoming;
  src.appendTo(incoming);
  if (incoming.size() % itemsize_ != 0) {
    throw exceptions::ValueError("bytes length not a multiple of item size");
  }
  auto permit = tryResizable();
  permit->insert(permit->end(), incoming.begin(), incoming.end());
}

} // namespace pybuf::rt

/***
 * Name: pybuf::rt::TypeObject, object_type
 * Purpose: Type hierarchy walks for the buffer slot and subtype checks.
 */
#include "runtime/Object.h"

namespace pybuf::rt {

AsBufferSlot TypeObject::findAsBuffer() const {
  for (const TypeObject* t = this; t != nullptr; t = t->base) {
    if (t->asBuffer != nullptr) { return t->asBuffer; }
  }
  return nullptr;
}

bool TypeObject::isSubtypeOf(const TypeObject& other) const {
  for (const TypeObject* t = this; t != nullptr; t = t->base) {
    if (t == &other) { return true; }
  }
  return false;
}

const TypeObject& object_type() {
  static const TypeObject type{"object", nullptr, TypeTag::Object, nullptr};
  return type;
}

} // namespace pybuf::rt

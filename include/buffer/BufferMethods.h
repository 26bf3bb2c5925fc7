/***
 * Name: pybuf::buffer::BufferMethods
 * Purpose: Per-provider-type function table backing ManagedBuffer.
 * Theory of Operation:
 *   Each provider type defines one static table and every ManagedBuffer over an
 *   object of that type points at it. Dispatch is a plain function-pointer call;
 *   traversal code never needs to know the concrete provider.
 *   - objBytes / objBytesMut: borrow the whole provider storage.
 *   - release / retain: adjust the provider's export count (may be no-ops).
 */
#pragma once

#include "buffer/Borrowed.h"

namespace pybuf::rt { class Object; }

namespace pybuf::buffer {

struct BufferMethods {
  BorrowedBytes (*objBytes)(rt::Object& obj);
  BorrowedBytesMut (*objBytesMut)(rt::Object& obj);
  void (*release)(rt::Object& obj);
  void (*retain)(rt::Object& obj);
};

}  // namespace pybuf::buffer

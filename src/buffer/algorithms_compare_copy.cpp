/***
 * Name: pybuf::buffer::equal, copyInto
 * Purpose: Paired traversal consumers: comparison and element-wise copy.
 * Theory of Operation:
 *   Both drive BufferDescriptor::zipEq over the two descriptors, so a strided
 *   view pairs up with a packed one element by element while two packed views
 *   move whole rows. equal stops at the first differing range.
 */
#include "buffer/Algorithms.h"
#include "pybuf/exceptions/buffer_error.h"
#include "pybuf/exceptions/value_error.h"
#include "runtime/Object.h"

#include <cstring>
#include <optional>
#include <string>

namespace pybuf::buffer {

static bool same_structure(const BufferDescriptor& a, const BufferDescriptor& b) {
  return a.sameShape(b) && a.itemsize() == b.itemsize() && a.format() == b.format();
}

static void require_within(ByteRange r, std::size_t size) {
  if (r.start < 0 || r.end > static_cast<std::ptrdiff_t>(size)) {
    throw exceptions::BufferError("buffer segment [" + std::to_string(r.start) + ", " + std::to_string(r.end) +
                                  ") outside provider storage");
  }
}

static bool same_provider(const ManagedBuffer& a, const ManagedBuffer& b) { return a.obj() == b.obj(); }

bool equal(const ManagedBuffer& a, const ManagedBuffer& b) {
  if (!same_structure(a.desc(), b.desc())) { return false; }
  if (same_provider(a, b)) { return toBytes(a) == toBytes(b); }

  std::optional<BorrowedBytes> aBytes;
  std::optional<BorrowedBytes> bBytes;
  if (a.obj().get() < b.obj().get()) {
    aBytes.emplace(a.objBytes());
    bBytes.emplace(b.objBytes());
  } else {
    bBytes.emplace(b.objBytes());
    aBytes.emplace(a.objBytes());
  }
  bool same = true;
  a.desc().zipEq(b.desc(), true, [&](ByteRange ra, ByteRange rb) {
    require_within(ra, aBytes->size());
    require_within(rb, bBytes->size());
    if (std::memcmp(aBytes->data() + ra.start, bBytes->data() + rb.start, ra.size()) != 0) {
      same = false;
      return true;
    }
    return false;
  });
  return same;
}

void copyInto(const ManagedBuffer& dst, const ManagedBuffer& src) {
  if (dst.desc().readonly()) { throw exceptions::BufferError("cannot modify read-only memory"); }
  if (!same_structure(dst.desc(), src.desc())) {
    throw exceptions::ValueError("buffer assignment: lvalue and rvalue have different structures");
  }

  if (same_provider(dst, src)) {
    // Overlapping views of one provider: snapshot the source, then scatter it
    // over the destination segments in logical order.
    const std::vector<unsigned char> snapshot = toBytes(src);
    const BorrowedBytesMut out = dst.objBytesMut();
    std::size_t cursor = 0;
    dst.desc().forEachSegment(true, [&](ByteRange r) {
      require_within(r, out.size());
      std::memcpy(out.data() + r.start, snapshot.data() + cursor, r.size());
      cursor += r.size();
    });
    return;
  }

  std::optional<BorrowedBytesMut> out;
  std::optional<BorrowedBytes> in;
  if (dst.obj().get() < src.obj().get()) {
    out.emplace(dst.objBytesMut());
    in.emplace(src.objBytes());
  } else {
    in.emplace(src.objBytes());
    out.emplace(dst.objBytesMut());
  }
  dst.desc().zipEq(src.desc(), true, [&](ByteRange rd, ByteRange rs) {
    require_within(rd, out->size());
    require_within(rs, in->size());
    std::memcpy(out->data() + rd.start, in->data() + rs.start, rd.size());
    return false;
  });
}

}  // namespace pybuf::buffer

/***
 * Name: pybuf::buffer::find
 * Purpose: Locate a byte subsequence inside a buffer's logical bytes.
 * Inputs:
 *   - haystack, needle: any buffer views
 * Outputs: Byte offset of the first match, or -1
 * Theory of Operation: The needle is collected up front (it is usually short and
 *   this keeps a single lock held at a time); the haystack is scanned in place
 *   when contiguous.
 */
#include "buffer/Algorithms.h"

#include <cstring>
#include <span>

namespace pybuf::buffer {

int64_t find(const ManagedBuffer& haystack, const ManagedBuffer& needle) {
  const std::vector<unsigned char> n = toBytes(needle);
  if (n.empty()) { return 0; }
  return haystack.contiguousOrCollect([&](std::span<const unsigned char> h) -> int64_t {
    if (n.size() > h.size()) { return -1; }
    for (std::size_t i = 0; i + n.size() <= h.size(); ++i) {
      if (std::memcmp(h.data() + i, n.data(), n.size()) == 0) { return static_cast<int64_t>(i); }
    }
    return -1;
  });
}

}  // namespace pybuf::buffer

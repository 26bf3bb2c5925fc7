/***
 * Name: pybuf::buffer algorithms
 * Purpose: Layout-agnostic byte operations over ManagedBuffer views.
 * Theory of Operation:
 *   Every function works on logical (row-major) bytes and picks the zero-copy
 *   path when the view is contiguous. When two views are borrowed at once they
 *   are locked in provider-address order; two views of the same provider go
 *   through a collected copy instead of borrowing twice.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <vector>

#include "buffer/ManagedBuffer.h"

namespace pybuf::rt { class Bytes; }

namespace pybuf::buffer {

std::vector<unsigned char> toBytes(const ManagedBuffer& buf);

// New immutable Bytes holding a's logical bytes followed by b's.
std::shared_ptr<rt::Bytes> concat(const ManagedBuffer& a, const ManagedBuffer& b);

// Offset of the first occurrence of needle in haystack; -1 if absent, 0 for an empty needle.
int64_t find(const ManagedBuffer& haystack, const ManagedBuffer& needle);

// Same shape, itemsize and format, and identical logical bytes.
bool equal(const ManagedBuffer& a, const ManagedBuffer& b);

// Element-wise copy. Throws BufferError for a read-only dst and ValueError when
// the structures differ.
void copyInto(const ManagedBuffer& dst, const ManagedBuffer& src);

// Write the logical bytes to out; returns the number of bytes written.
std::size_t writeTo(std::ostream& out, const ManagedBuffer& buf);

}  // namespace pybuf::buffer

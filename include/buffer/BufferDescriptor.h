/***
 * Name: pybuf::buffer::BufferDescriptor
 * Purpose: Describe a provider's memory as an N-dimensional strided view.
 * Inputs: Byte length, readonly flag, itemsize, format label and per-dimension
 *   (shape, stride, suboffset) triples, outermost dimension first.
 * Outputs: Contiguity analysis, element positions and segment traversals.
 * Theory of Operation:
 *   Offsets produced here are relative to the start of the provider storage
 *   returned by objBytes(). The byte of element (i0..in) starts at
 *   sum(i_k * stride_k + suboffset_k); a non-negative suboffset lets a view
 *   with negative strides start inside the storage. The format label is
 *   carried for producers and consumers and never interpreted here.
 *   Descriptors are values: transformations return new descriptors.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pybuf::buffer {

struct DimDesc {
  std::size_t shape{0};
  std::ptrdiff_t stride{0};
  std::ptrdiff_t suboffset{0};

  bool operator==(const DimDesc&) const = default;
};

// Half-open byte range [start, end) inside provider storage.
struct ByteRange {
  std::ptrdiff_t start{0};
  std::ptrdiff_t end{0};

  std::size_t size() const { return static_cast<std::size_t>(end - start); }
  bool operator==(const ByteRange&) const = default;
};

class BufferDescriptor {
 public:
  // No validation here; ManagedBuffer validates on construction.
  BufferDescriptor(std::size_t len, bool readonly, std::size_t itemsize, std::string format,
                   std::vector<DimDesc> dims);

  // 1-D unsigned bytes: itemsize 1, format "B", single dimension (len, 1, 0).
  static BufferDescriptor simple(std::size_t bytesLen, bool readonly);

  // 1-D typed layout: single dimension (len / itemsize, itemsize, 0).
  static BufferDescriptor format(std::size_t bytesLen, bool readonly, std::size_t itemsize,
                                 std::string format);

  std::size_t len() const { return len_; }
  bool readonly() const { return readonly_; }
  std::size_t itemsize() const { return itemsize_; }
  const std::string& format() const { return format_; }
  const std::vector<DimDesc>& dims() const { return dims_; }
  std::size_t ndim() const { return dims_.size(); }
  std::vector<std::size_t> shape() const;
  bool sameShape(const BufferDescriptor& other) const;

  // First violated invariant, or nothing when the descriptor is well formed.
  std::optional<std::string> checkInvariants() const;

  // Fatal on violation when validation is enabled (see rt::validation_enabled).
  const BufferDescriptor& validate() const;

  // Row-major contiguity only; column-major layouts are never reported contiguous.
  bool isContiguous() const;
  bool isLastDimContiguous() const;
  bool isZeroInShape() const;
  bool hasSuboffsets() const;

  BufferDescriptor asReadonly() const;

  // Unchecked: indices.size() must equal ndim() and every index be in range.
  std::ptrdiff_t fastPosition(const std::vector<std::size_t>& indices) const;

  // Negative indices count from the end of their dimension. Throws IndexError.
  std::ptrdiff_t position(const std::vector<std::ptrdiff_t>& indices) const;

  // Visit maximal contiguous byte ranges in row-major order. With tryContiguous
  // and a contiguous innermost dimension, each innermost row is one range;
  // otherwise every element is its own itemsize-byte range.
  template <typename F>
  void forEachSegment(bool tryContiguous, F&& visit) const;

  // Paired traversal over two descriptors of identical shape. visit2 returns true
  // to stop the whole traversal early.
  template <typename F>
  void zipEq(const BufferDescriptor& other, bool tryContiguous, F&& visit2) const;

 private:
  template <bool Contiguous, typename F>
  void segmentsFrom(std::ptrdiff_t index, std::size_t dim, F& visit) const;

  template <bool Contiguous, typename F>
  bool zipFrom(const BufferDescriptor& other, std::ptrdiff_t aIndex, std::ptrdiff_t bIndex,
               std::size_t dim, F& visit2) const;

  std::size_t len_;
  bool readonly_;
  std::size_t itemsize_;
  std::string format_;
  std::vector<DimDesc> dims_;
};

}  // namespace pybuf::buffer

#include "buffer/detail/Traversal.h"

/***
 * Name: pybuf::buffer traversal templates
 * Purpose: Segment enumeration and paired (zip) traversal over descriptors.
 * Theory of Operation:
 *   The traversal mode (fused rows vs. one range per element) is decided once in
 *   the public entry point and baked into the recursive helper as a template
 *   parameter, so the recursion itself never re-tests contiguity. Both modes
 *   visit in the same row-major order. A fully contiguous view without
 *   suboffsets is a single range. A zero in the shape means nothing is visited.
 */
#pragma once

#include <cassert>
#include <cstddef>

namespace pybuf::buffer {

template <typename F>
void BufferDescriptor::forEachSegment(bool tryContiguous, F&& visit) const {
  const auto item = static_cast<std::ptrdiff_t>(itemsize_);
  if (ndim() == 0) {
    visit(ByteRange{0, item});
    return;
  }
  if (isZeroInShape()) { return; }
  if (tryContiguous && isContiguous() && !hasSuboffsets()) {
    visit(ByteRange{0, static_cast<std::ptrdiff_t>(len_)});
    return;
  }
  if (tryContiguous && isLastDimContiguous()) {
    segmentsFrom<true>(0, 0, visit);
  } else {
    segmentsFrom<false>(0, 0, visit);
  }
}

template <bool Contiguous, typename F>
void BufferDescriptor::segmentsFrom(std::ptrdiff_t index, std::size_t dim, F& visit) const {
  const DimDesc& d = dims_[dim];
  const auto item = static_cast<std::ptrdiff_t>(itemsize_);
  if (dim + 1 == ndim()) {
    if constexpr (Contiguous) {
      visit(ByteRange{index, index + static_cast<std::ptrdiff_t>(d.shape) * item});
    } else {
      for (std::size_t i = 0; i < d.shape; ++i) {
        const std::ptrdiff_t pos = index + d.suboffset;
        visit(ByteRange{pos, pos + item});
        index += d.stride;
      }
    }
    return;
  }
  for (std::size_t i = 0; i < d.shape; ++i) {
    segmentsFrom<Contiguous>(index + d.suboffset, dim + 1, visit);
    index += d.stride;
  }
}

template <typename F>
void BufferDescriptor::zipEq(const BufferDescriptor& other, bool tryContiguous, F&& visit2) const {
  if (ndim() == 0) {
    visit2(ByteRange{0, static_cast<std::ptrdiff_t>(itemsize_)},
           ByteRange{0, static_cast<std::ptrdiff_t>(other.itemsize_)});
    return;
  }
  assert(sameShape(other) && "zipEq requires descriptors of identical shape");
  if (isZeroInShape()) { return; }
  if (tryContiguous && isContiguous() && !hasSuboffsets() && other.isContiguous() && !other.hasSuboffsets()) {
    (void)visit2(ByteRange{0, static_cast<std::ptrdiff_t>(len_)},
                 ByteRange{0, static_cast<std::ptrdiff_t>(other.len_)});
    return;
  }
  if (tryContiguous && isLastDimContiguous() && other.isLastDimContiguous()) {
    (void)zipFrom<true>(other, 0, 0, 0, visit2);
  } else {
    (void)zipFrom<false>(other, 0, 0, 0, visit2);
  }
}

// Returns true once visit2 asked to stop.
template <bool Contiguous, typename F>
bool BufferDescriptor::zipFrom(const BufferDescriptor& other, std::ptrdiff_t aIndex, std::ptrdiff_t bIndex,
                               std::size_t dim, F& visit2) const {
  const DimDesc& a = dims_[dim];
  const DimDesc& b = other.dims_[dim];
  const auto aItem = static_cast<std::ptrdiff_t>(itemsize_);
  const auto bItem = static_cast<std::ptrdiff_t>(other.itemsize_);
  if (dim + 1 == ndim()) {
    if constexpr (Contiguous) {
      const auto n = static_cast<std::ptrdiff_t>(a.shape);
      return visit2(ByteRange{aIndex, aIndex + n * aItem}, ByteRange{bIndex, bIndex + n * bItem});
    } else {
      for (std::size_t i = 0; i < a.shape; ++i) {
        const std::ptrdiff_t aPos = aIndex + a.suboffset;
        const std::ptrdiff_t bPos = bIndex + b.suboffset;
        if (visit2(ByteRange{aPos, aPos + aItem}, ByteRange{bPos, bPos + bItem})) { return true; }
        aIndex += a.stride;
        bIndex += b.stride;
      }
      return false;
    }
  }
  for (std::size_t i = 0; i < a.shape; ++i) {
    if (zipFrom<Contiguous>(other, aIndex + a.suboffset, bIndex + b.suboffset, dim + 1, visit2)) { return true; }
    aIndex += a.stride;
    bIndex += b.stride;
  }
  return false;
}

}  // namespace pybuf::buffer

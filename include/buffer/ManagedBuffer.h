/***
 * Name: pybuf::buffer::ManagedBuffer, DetachedBuffer
 * Purpose: A counted export binding a descriptor to a provider object and its
 *   BufferMethods table.
 * Inputs: Provider handle (shared ownership), validated descriptor, method table.
 * Outputs: Borrowed and collected views of the logical bytes.
 * Theory of Operation:
 *   - Construction validates the descriptor and retains one export on the
 *     provider; destruction releases it exactly once. Copies are new exports
 *     (retain again); moves hand the pending release to the destination.
 *   - Contiguous views are served zero-copy from the provider storage. Other
 *     layouts are walked with BufferDescriptor::forEachSegment, always yielding
 *     bytes in logical row-major order.
 *   - detachWithoutRelease() is the escape hatch for moving the (provider,
 *     descriptor) pair into another owner without double counting: the returned
 *     DetachedBuffer owes exactly one release. Forgetting it leaks an export
 *     count; the provider itself stays alive through the shared handle.
 */
#pragma once

#include <cassert>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "buffer/BufferDescriptor.h"
#include "buffer/BufferMethods.h"
#include "runtime/BufferStats.h"
#include "runtime/Log.h"

namespace pybuf::rt { class Object; }

namespace pybuf::buffer {

class DetachedBuffer;

class ManagedBuffer {
 public:
  ManagedBuffer(std::shared_ptr<rt::Object> obj, BufferDescriptor desc, const BufferMethods& methods);
  ~ManagedBuffer();

  ManagedBuffer(const ManagedBuffer& other);
  ManagedBuffer(ManagedBuffer&& other) noexcept;
  ManagedBuffer& operator=(const ManagedBuffer&) = delete;
  ManagedBuffer& operator=(ManagedBuffer&& other) noexcept;

  // Read-only simple buffer over a fresh VecBuffer owning `bytes`.
  static ManagedBuffer fromByteVector(std::vector<unsigned char> bytes);

  // Buffer lookup through the object's type hierarchy. Throws TypeError when no
  // type in the chain registers a buffer slot.
  static ManagedBuffer fromObject(const std::shared_ptr<rt::Object>& obj);

  const BufferDescriptor& desc() const { return desc_; }
  const std::shared_ptr<rt::Object>& obj() const { return obj_; }

  // Caller guarantees the provider really is a T (the method table says so).
  template <typename T>
  T& objAs() const {
    return static_cast<T&>(*obj_);
  }

  BorrowedBytes objBytes() const;
  // Contract: desc().readonly() is false; callers reject read-only views first.
  BorrowedBytesMut objBytesMut() const;

  std::optional<BorrowedBytes> asContiguous() const;
  std::optional<BorrowedBytesMut> asContiguousMut() const;

  // Skip the contiguity check; the caller already knows the layout is contiguous.
  BorrowedBytes contiguousUnchecked() const;
  BorrowedBytesMut contiguousMutUnchecked() const;

  void appendTo(std::vector<unsigned char>& sink) const;

  // f receives the logical bytes as std::span<const unsigned char>: borrowed
  // when contiguous, otherwise a temporary collected copy.
  template <typename F>
  decltype(auto) contiguousOrCollect(F&& f) const;

  // Forget the pending release; see DetachedBuffer.
  [[nodiscard]] DetachedBuffer detachWithoutRelease() &&;

 private:
  friend class DetachedBuffer;
  struct AdoptTag {};

  // Takes over an export that was already retained.
  ManagedBuffer(AdoptTag, std::shared_ptr<rt::Object> obj, BufferDescriptor desc, const BufferMethods* methods);

  void releaseIfAttached() noexcept;

  std::shared_ptr<rt::Object> obj_;
  BufferDescriptor desc_;
  const BufferMethods* methods_;
};

class DetachedBuffer {
 public:
  DetachedBuffer(DetachedBuffer&& other) noexcept;
  DetachedBuffer(const DetachedBuffer&) = delete;
  DetachedBuffer& operator=(const DetachedBuffer&) = delete;
  DetachedBuffer& operator=(DetachedBuffer&&) = delete;
  ~DetachedBuffer();

  const BufferDescriptor& desc() const { return desc_; }
  const std::shared_ptr<rt::Object>& obj() const { return obj_; }

  // Perform the single release still owed to the provider.
  void releaseExport() &&;

  // Hand the owed release back to a ManagedBuffer without retaining again.
  ManagedBuffer reattach() &&;

 private:
  friend class ManagedBuffer;
  DetachedBuffer(std::shared_ptr<rt::Object> obj, BufferDescriptor desc, const BufferMethods* methods);

  std::shared_ptr<rt::Object> obj_;
  BufferDescriptor desc_;
  const BufferMethods* methods_;
};

template <typename F>
decltype(auto) ManagedBuffer::contiguousOrCollect(F&& f) const {
  if (auto bytes = asContiguous()) {
    rt::stats_note_contiguous_hit();
    return std::forward<F>(f)(std::span<const unsigned char>(bytes->data(), bytes->size()));
  }
  std::vector<unsigned char> collected;
  collected.reserve(desc_.len());
  appendTo(collected);
  rt::stats_note_collect_fallback(collected.size());
  PYBUF_RT_LOG(2, "collected %zu bytes from non-contiguous view (ndim=%zu)", collected.size(), desc_.ndim());
  return std::forward<F>(f)(std::span<const unsigned char>(collected.data(), collected.size()));
}

}  // namespace pybuf::buffer

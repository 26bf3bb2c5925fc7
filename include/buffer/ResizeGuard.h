/***
 * Name: pybuf::buffer::ResizePermit, BufferResizeGuard
 * Purpose: Resize-safety protocol for providers whose length can change.
 * Theory of Operation:
 *   A provider derives from BufferResizeGuard<Self> and implements
 *   tryResizableOpt(), returning a permit only while its own export count is
 *   zero. The permit holds the provider's storage lock exclusively, so no
 *   borrow can observe the storage mid-resize; it is valid for its scope only.
 *   tryResizable() turns a refusal into BufferError for call sites that need a
 *   hard failure.
 */
#pragma once

#include <mutex>
#include <shared_mutex>
#include <utility>

#include "pybuf/exceptions/buffer_error.h"
#include "runtime/Log.h"

namespace pybuf::buffer {

template <typename Storage>
class ResizePermit {
 public:
  ResizePermit(std::unique_lock<std::shared_mutex> lock, Storage& storage)
      : lock_(std::move(lock)), storage_(&storage) {}

  ResizePermit(ResizePermit&&) noexcept = default;
  ResizePermit& operator=(ResizePermit&&) noexcept = default;

  Storage& operator*() const { return *storage_; }
  Storage* operator->() const { return storage_; }

 private:
  std::unique_lock<std::shared_mutex> lock_;
  Storage* storage_;
};

template <typename Derived>
class BufferResizeGuard {
 public:
  auto tryResizable() {
    auto permit = static_cast<Derived&>(*this).tryResizableOpt();
    if (!permit) {
      PYBUF_RT_LOG(1, "resize refused: provider has outstanding exports");
      throw exceptions::BufferError("Existing exports of data: object cannot be re-sized");
    }
    return std::move(*permit);
  }

 protected:
  BufferResizeGuard() = default;
  ~BufferResizeGuard() = default;
};

}  // namespace pybuf::buffer

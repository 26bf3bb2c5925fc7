/***
 * Name: pybuf::rt::ResizableBytes
 * Purpose: Export counting, locked borrows and the resize permit.
 * Theory of Operation:
 *   The permit is granted under the exclusive lock after re-reading the export
 *   count, so a borrow can never overlap a resize. Exports themselves are
 *   counted without the lock.
 */
#include "runtime/ResizableBytes.h"

#include <mutex>
#include <utility>

namespace pybuf::rt {

struct ResizableBytesExports {
  static void retain(Object& obj) {
    static_cast<ResizableBytes&>(obj).exports_.fetch_add(1, std::memory_order_acq_rel);
  }
  static void release(Object& obj) {
    static_cast<ResizableBytes&>(obj).exports_.fetch_sub(1, std::memory_order_acq_rel);
  }
};

static const buffer::BufferMethods kResizableBytesMethods{
    [](Object& obj) { return static_cast<const ResizableBytes&>(obj).borrow(); },
    [](Object& obj) { return static_cast<ResizableBytes&>(obj).borrowMut(); },
    &ResizableBytesExports::release,
    &ResizableBytesExports::retain,
};

ResizableBytes::ResizableBytes(const TypeObject& type, std::vector<unsigned char> data)
    : Object(type), data_(std::move(data)) {}

const buffer::BufferMethods& ResizableBytes::methods() { return kResizableBytesMethods; }

std::optional<ResizableBytes::Resizable> ResizableBytes::tryResizableOpt() {
  std::unique_lock<std::shared_mutex> lock(mu_);
  if (exports_.load(std::memory_order_acquire) != 0) { return std::nullopt; }
  return Resizable(std::move(lock), data_);
}

std::size_t ResizableBytes::byteLen() const {
  const std::shared_lock<std::shared_mutex> lock(mu_);
  return data_.size();
}

buffer::BorrowedBytes ResizableBytes::borrow() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return {data_.data(), data_.size(), std::move(lock)};
}

buffer::BorrowedBytesMut ResizableBytes::borrowMut() {
  std::unique_lock<std::shared_mutex> lock(mu_);
  return {data_.data(), data_.size(), std::move(lock)};
}

std::vector<unsigned char> ResizableBytes::toVector() const {
  const std::shared_lock<std::shared_mutex> lock(mu_);
  return data_;
}

} // namespace pybuf::rt

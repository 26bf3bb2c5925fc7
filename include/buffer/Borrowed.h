/***
 * Name: pybuf::buffer::Borrowed, BorrowedBytes, BorrowedBytesMut
 * Purpose: Scoped borrow of a provider's storage.
 * Theory of Operation:
 *   A borrow carries the provider's lock (shared for reads, exclusive for writes)
 *   and releases it when the borrow goes out of scope. Immutable providers hand
 *   out borrows without a lock. Borrows are move-only.
 */
#pragma once

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <utility>

namespace pybuf::buffer {

template <typename Byte, typename Lock>
class Borrowed {
 public:
  Borrowed(Byte* data, std::size_t size) : data_(data), size_(size) {}
  Borrowed(Byte* data, std::size_t size, Lock lock) : lock_(std::move(lock)), data_(data), size_(size) {}

  Borrowed(Borrowed&&) noexcept = default;
  Borrowed& operator=(Borrowed&&) noexcept = default;
  Borrowed(const Borrowed&) = delete;
  Borrowed& operator=(const Borrowed&) = delete;

  Byte* data() const { return data_; }
  std::size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }
  Byte* begin() const { return data_; }
  Byte* end() const { return data_ + size_; }
  Byte& operator[](std::size_t i) const { return data_[i]; }
  std::span<Byte> span() const { return {data_, size_}; }

  // Keep only the first n bytes (or all of them when shorter).
  Borrowed prefix(std::size_t n) && {
    size_ = std::min(n, size_);
    return std::move(*this);
  }

 private:
  Lock lock_{};
  Byte* data_;
  std::size_t size_;
};

using BorrowedBytes = Borrowed<const unsigned char, std::shared_lock<std::shared_mutex>>;
using BorrowedBytesMut = Borrowed<unsigned char, std::unique_lock<std::shared_mutex>>;

}  // namespace pybuf::buffer

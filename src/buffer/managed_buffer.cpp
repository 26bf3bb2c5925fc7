/***
 * Name: pybuf::buffer::ManagedBuffer (lifecycle and views)
 * Purpose: Export accounting plus borrowed and collected access to provider bytes.
 * Theory of Operation:
 *   Retain happens once per constructed (or copied) ManagedBuffer and release
 *   once per destroyed one that still owns its export; a moved-from or detached
 *   buffer has a null provider handle and releases nothing.
 */
#include "buffer/ManagedBuffer.h"
#include "pybuf/exceptions/buffer_error.h"
#include "runtime/Object.h"

#include <utility>

namespace pybuf::buffer {

ManagedBuffer::ManagedBuffer(std::shared_ptr<rt::Object> obj, BufferDescriptor desc, const BufferMethods& methods)
    : obj_(std::move(obj)), desc_(std::move(desc)), methods_(&methods) {
  assert(obj_ && "ManagedBuffer requires a provider");
  desc_.validate();
  methods_->retain(*obj_);
  rt::stats_note_export_created();
  PYBUF_RT_LOG(1, "export retained type=%s len=%zu ndim=%zu", obj_->type().name.c_str(), desc_.len(), desc_.ndim());
}

ManagedBuffer::ManagedBuffer(AdoptTag, std::shared_ptr<rt::Object> obj, BufferDescriptor desc,
                             const BufferMethods* methods)
    : obj_(std::move(obj)), desc_(std::move(desc)), methods_(methods) {}

ManagedBuffer::ManagedBuffer(const ManagedBuffer& other)
    : ManagedBuffer(other.obj_, other.desc_, *other.methods_) {}

ManagedBuffer::ManagedBuffer(ManagedBuffer&& other) noexcept
    : obj_(std::move(other.obj_)), desc_(std::move(other.desc_)), methods_(other.methods_) {
  other.obj_.reset();
}

ManagedBuffer& ManagedBuffer::operator=(ManagedBuffer&& other) noexcept {
  if (this != &other) {
    releaseIfAttached();
    obj_ = std::move(other.obj_);
    other.obj_.reset();
    desc_ = std::move(other.desc_);
    methods_ = other.methods_;
  }
  return *this;
}

ManagedBuffer::~ManagedBuffer() { releaseIfAttached(); }

void ManagedBuffer::releaseIfAttached() noexcept {
  if (!obj_) { return; }
  methods_->release(*obj_);
  rt::stats_note_export_released();
  PYBUF_RT_LOG(1, "export released type=%s len=%zu", obj_->type().name.c_str(), desc_.len());
  obj_.reset();
}

BorrowedBytes ManagedBuffer::objBytes() const { return methods_->objBytes(*obj_); }

BorrowedBytesMut ManagedBuffer::objBytesMut() const {
  assert(!desc_.readonly() && "mutable borrow of a read-only buffer");
  return methods_->objBytesMut(*obj_);
}

BorrowedBytes ManagedBuffer::contiguousUnchecked() const { return objBytes().prefix(desc_.len()); }

BorrowedBytesMut ManagedBuffer::contiguousMutUnchecked() const { return objBytesMut().prefix(desc_.len()); }

static void require_storage(std::size_t have, std::size_t need) {
  if (have < need) {
    throw exceptions::BufferError("buffer view exceeds provider storage (" + std::to_string(need) + " > " +
                                  std::to_string(have) + " bytes)");
  }
}

std::optional<BorrowedBytes> ManagedBuffer::asContiguous() const {
  if (!desc_.isContiguous() || desc_.hasSuboffsets()) { return std::nullopt; }
  BorrowedBytes bytes = contiguousUnchecked();
  require_storage(bytes.size(), desc_.len());
  return bytes;
}

std::optional<BorrowedBytesMut> ManagedBuffer::asContiguousMut() const {
  if (desc_.readonly() || !desc_.isContiguous() || desc_.hasSuboffsets()) { return std::nullopt; }
  BorrowedBytesMut bytes = contiguousMutUnchecked();
  require_storage(bytes.size(), desc_.len());
  return bytes;
}

void ManagedBuffer::appendTo(std::vector<unsigned char>& sink) const {
  if (auto bytes = asContiguous()) {
    sink.insert(sink.end(), bytes->begin(), bytes->end());
    return;
  }
  const BorrowedBytes bytes = objBytes();
  const auto have = static_cast<std::ptrdiff_t>(bytes.size());
  desc_.forEachSegment(true, [&](ByteRange range) {
    if (range.start < 0 || range.end > have) {
      throw exceptions::BufferError("buffer segment [" + std::to_string(range.start) + ", " +
                                    std::to_string(range.end) + ") outside provider storage");
    }
    sink.insert(sink.end(), bytes.data() + range.start, bytes.data() + range.end);
  });
}

DetachedBuffer ManagedBuffer::detachWithoutRelease() && {
  assert(obj_ && "detach of an empty ManagedBuffer");
  rt::stats_note_export_detached();
  PYBUF_RT_LOG(1, "export detached type=%s len=%zu", obj_->type().name.c_str(), desc_.len());
  DetachedBuffer detached(std::move(obj_), std::move(desc_), methods_);
  obj_.reset();
  return detached;
}

DetachedBuffer::DetachedBuffer(std::shared_ptr<rt::Object> obj, BufferDescriptor desc, const BufferMethods* methods)
    : obj_(std::move(obj)), desc_(std::move(desc)), methods_(methods) {}

DetachedBuffer::DetachedBuffer(DetachedBuffer&& other) noexcept
    : obj_(std::move(other.obj_)), desc_(std::move(other.desc_)), methods_(other.methods_) {
  other.obj_.reset();
}

DetachedBuffer::~DetachedBuffer() {
  if (obj_) {
    PYBUF_RT_LOG(1, "detached export of type=%s dropped without release", obj_->type().name.c_str());
  }
}

void DetachedBuffer::releaseExport() && {
  if (!obj_) { return; }
  methods_->release(*obj_);
  rt::stats_note_export_released();
  obj_.reset();
}

ManagedBuffer DetachedBuffer::reattach() && {
  assert(obj_ && "reattach of a consumed DetachedBuffer");
  ManagedBuffer adopted(ManagedBuffer::AdoptTag{}, std::move(obj_), std::move(desc_), methods_);
  obj_.reset();
  return adopted;
}

}  // namespace pybuf::buffer

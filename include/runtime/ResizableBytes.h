/***
 * Name: pybuf::rt::ResizableBytes
 * Purpose: Shared base for providers whose length can change (ByteArray, Array).
 * Theory of Operation:
 *   Storage sits behind a shared mutex; every ManagedBuffer over the object
 *   counts as one export through the atomic export counter. Length-changing
 *   operations must go through tryResizable()/tryResizableOpt(), which only
 *   grant a permit while no export is outstanding.
 *   Exports are built with exportView(), which holds the storage lock shared
 *   from the length read until the export is retained, so a permit can never
 *   be granted between the two.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

#include "buffer/BufferMethods.h"
#include "buffer/ManagedBuffer.h"
#include "buffer/ResizeGuard.h"
#include "runtime/Object.h"

namespace pybuf::rt {
    class ResizableBytes : public Object, public buffer::BufferResizeGuard<ResizableBytes> {
    public:
        using Resizable = buffer::ResizePermit<std::vector<unsigned char>>;

        std::optional<Resizable> tryResizableOpt();

        std::size_t exports() const { return exports_.load(std::memory_order_acquire); }

        std::size_t byteLen() const;

        buffer::BorrowedBytes borrow() const;

        buffer::BorrowedBytesMut borrowMut();

        std::vector<unsigned char> toVector() const;

        // Shared by every subclass: locked borrows plus export counting.
        static const buffer::BufferMethods &methods();

        // makeDesc receives the current byte length and returns the descriptor.
        template <typename MakeDesc>
        static buffer::ManagedBuffer exportView(const std::shared_ptr<Object> &obj, MakeDesc &&makeDesc) {
            auto &self = static_cast<ResizableBytes &>(*obj);
            const std::shared_lock<std::shared_mutex> lock(self.mu_);
            return buffer::ManagedBuffer(obj, std::forward<MakeDesc>(makeDesc)(self.data_.size()), methods());
        }

    protected:
        ResizableBytes(const TypeObject &type, std::vector<unsigned char> data);

    private:
        friend struct ResizableBytesExports;

        mutable std::shared_mutex mu_;
        std::vector<unsigned char> data_;
        std::atomic<std::size_t> exports_{0};
    };
} // namespace pybuf::rt

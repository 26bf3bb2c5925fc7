/***
 * Name: pybuf::rt::VecBuffer
 * Purpose: Default buffer provider over a lock-guarded growable byte vector.
 * Theory of Operation:
 *   Borrows hold the storage lock for their lifetime (shared for reads,
 *   exclusive for writes). retain/release are no-ops: VecBuffer does not guard
 *   resizes, so take() while a view is alive leaves that view pointing past the
 *   (now empty) storage; ManagedBuffer reports that as BufferError on access.
 *   VecBuffer has no buffer slot; it is wrapped explicitly with intoBuffer.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <span>
#include <vector>

#include "buffer/ManagedBuffer.h"
#include "runtime/Object.h"

namespace pybuf::rt {
    const TypeObject &vec_buffer_type();

    class VecBuffer : public Object {
    public:
        explicit VecBuffer(std::vector<unsigned char> data = {});

        // Swap the storage for an empty vector and return the previous contents.
        std::vector<unsigned char> take();

        void append(std::span<const unsigned char> bytes);

        std::size_t size() const;

        buffer::BorrowedBytes borrow() const;

        buffer::BorrowedBytesMut borrowMut();

        static buffer::ManagedBuffer intoBuffer(std::shared_ptr<VecBuffer> self, bool readonly);

        static buffer::ManagedBuffer intoBufferWithDescriptor(std::shared_ptr<VecBuffer> self,
                                                              buffer::BufferDescriptor desc);

        static const buffer::BufferMethods &methods();

    private:
        mutable std::shared_mutex mu_;
        std::vector<unsigned char> data_;
    };
} // namespace pybuf::rt

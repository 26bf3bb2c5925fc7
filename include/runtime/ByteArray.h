/***
 * Name: pybuf::rt::ByteArray
 * Purpose: Mutable, growable byte array provider with resize protection.
 * Theory of Operation:
 *   Element reads and writes borrow the storage and never change its length.
 *   append/extend/resize/clear first obtain a resize permit and therefore throw
 *   BufferError while any buffer export of the array is alive.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "buffer/ManagedBuffer.h"
#include "runtime/ResizableBytes.h"

namespace pybuf::rt {
    const TypeObject &bytearray_type();

    class ByteArray : public ResizableBytes {
    public:
        explicit ByteArray(std::vector<unsigned char> data = {}, const TypeObject &type = bytearray_type());

        static std::shared_ptr<ByteArray> create(std::vector<unsigned char> data = {});

        std::size_t size() const { return byteLen(); }

        // Negative indices count from the end. Throws IndexError.
        int get(std::ptrdiff_t index) const;

        // Throws IndexError, or ValueError when value is outside 0..255.
        void set(std::ptrdiff_t index, int value);

        void append(int value);

        // Appends the logical bytes of any buffer (including strided views).
        void extend(const buffer::ManagedBuffer &src);

        void resize(std::size_t n);

        void clear();

        static buffer::ManagedBuffer exportReadonly(const std::shared_ptr<ByteArray> &self);
    };
} // namespace pybuf::rt

/***
 * Name: pybuf::rt::Array
 * Purpose: Typed array provider (array-module style) exposing a formatted buffer.
 * Theory of Operation:
 *   The typecode doubles as the buffer format label; the itemsize comes from the
 *   struct format helper. Elements are stored packed in native byte order.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "buffer/ManagedBuffer.h"
#include "runtime/ResizableBytes.h"

namespace pybuf::rt {
    const TypeObject &array_type();

    class Array : public ResizableBytes {
    public:
        Array(char typecode, std::size_t itemsize, const TypeObject &type = array_type());

        // Throws ValueError for typecodes outside b B h H i I l L q Q f d.
        static std::shared_ptr<Array> create(char typecode);

        char typecode() const { return typecode_; }

        std::size_t itemsize() const { return itemsize_; }

        std::size_t size() const { return byteLen() / itemsize_; }

        // Append one element given as itemsize() raw bytes.
        void appendRaw(const void *item);

        // Append the logical bytes of `src` as elements. Throws ValueError when
        // the byte count is not a multiple of itemsize().
        void frombytes(const buffer::ManagedBuffer &src);

        std::vector<unsigned char> tobytes() const { return toVector(); }

    private:
        char typecode_;
        std::size_t itemsize_;
    };
} // namespace pybuf::rt

/***
 * Name: pybuf::rt::Bytes
 * Purpose: Immutable byte string provider.
 * Theory of Operation: Storage never changes after construction, so borrows take
 *   no lock and exports need no accounting. Its buffer is always read-only.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "buffer/ManagedBuffer.h"
#include "runtime/Object.h"

namespace pybuf::rt {
    class VecBuffer;

    const TypeObject &bytes_type();

    class Bytes : public Object {
    public:
        explicit Bytes(std::vector<unsigned char> data, const TypeObject &type = bytes_type());

        static std::shared_ptr<Bytes> create(std::vector<unsigned char> data);

        // Hand off the bytes accumulated in `source` without copying them.
        static std::shared_ptr<Bytes> fromVecBuffer(VecBuffer &source);

        std::size_t size() const { return data_.size(); }

        const unsigned char *data() const { return data_.data(); }

        const std::vector<unsigned char> &bytes() const { return data_; }

        static const buffer::BufferMethods &methods();

    private:
        const std::vector<unsigned char> data_;
    };
} // namespace pybuf::rt

/***
 * Name: pybuf::rt::TypeTag
 * Purpose: Tags used by the runtime to identify heap object kinds.
 */
#pragma once

#include <cstdint>

namespace pybuf::rt {
    enum class TypeTag : uint32_t {
        Object = 1,
        Bytes = 2,
        ByteArray = 3,
        Array = 4,
        VecBuffer = 5
    };
} // namespace pybuf::rt

/***
 * Name: pybuf::rt::Object, TypeObject
 * Purpose: Minimal object model hosting buffer providers.
 * Theory of Operation:
 *   - Every heap object is owned through std::shared_ptr<Object> and points at a
 *     static TypeObject describing its kind.
 *   - TypeObject forms a single-inheritance chain via `base`. The `asBuffer`
 *     slot marks a type as buffer-capable; lookups walk the chain so subclasses
 *     of a provider type inherit its buffer support.
 */
#pragma once

#include <memory>
#include <string>
#include "runtime/TypeTag.h"

namespace pybuf::buffer { class ManagedBuffer; }

namespace pybuf::rt {
    class Object;

    using AsBufferSlot = buffer::ManagedBuffer (*)(const std::shared_ptr<Object> &obj);

    struct TypeObject {
        std::string name;
        const TypeObject *base{nullptr};
        TypeTag tag{TypeTag::Object};
        AsBufferSlot asBuffer{nullptr};

        // First non-null asBuffer along this -> base -> base->base ...; nullptr if none.
        AsBufferSlot findAsBuffer() const;

        bool isSubtypeOf(const TypeObject &other) const;
    };

    // Root type ("object"); has no buffer slot.
    const TypeObject &object_type();

    class Object {
    public:
        explicit Object(const TypeObject &type) : type_(&type) {}

        virtual ~Object() = default;

        Object(const Object &) = delete;

        Object &operator=(const Object &) = delete;

        const TypeObject &type() const { return *type_; }

    private:
        const TypeObject *type_;
    };
} // namespace pybuf::rt

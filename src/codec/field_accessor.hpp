// src/codec/field_accessor.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace codec {

class BitSerializable;

/**
 * FieldAccessor - type-erased access to one member of a live record.
 *
 * The codec engine only ever sees records as void pointers; the accessor
 * created for a field by its declaration knows the concrete member type.
 * Each accessor implements the group of methods matching its field kind,
 * everything else throws std::logic_error.
 */
class FieldAccessor {
public:
    virtual ~FieldAccessor() = default;

    // ------------------------------------------------------------------
    // Primitive / Enum
    // ------------------------------------------------------------------

    // Width of the member type in bits (enums: their underlying type)
    virtual int natural_bits() const { return unsupported<int>("natural_bits"); }

    // Member value as a raw bit copy, zero-extended
    virtual uint64_t get_raw(const void*) const { return unsupported<uint64_t>("get_raw"); }

    // Truncating raw bit copy into the member
    virtual void set_raw(void*, uint64_t) const { unsupported<int>("set_raw"); }

    // Member value as a signed integer; used for counts and discriminators
    virtual int64_t get_integer(const void*) const { return unsupported<int64_t>("get_integer"); }

    // ------------------------------------------------------------------
    // Nested
    // ------------------------------------------------------------------

    virtual const void* nested(const void*) const { return unsupported<const void*>("nested"); }
    virtual void* nested_mut(void*) const { return unsupported<void*>("nested_mut"); }

    // ------------------------------------------------------------------
    // List
    // ------------------------------------------------------------------

    virtual size_t size(const void*) const { return unsupported<size_t>("size"); }

    // Fixed capacity of array-like containers, 0 for growable ones
    virtual size_t capacity() const { return unsupported<size_t>("capacity"); }

    // Replaces the content with n default-constructed elements
    virtual void resize(void*, size_t) const { unsupported<int>("resize"); }

    virtual int element_natural_bits() const { return unsupported<int>("element_natural_bits"); }
    virtual uint64_t get_element_raw(const void*, size_t) const { return unsupported<uint64_t>("get_element_raw"); }
    virtual void set_element_raw(void*, size_t, uint64_t) const { unsupported<int>("set_element_raw"); }

    virtual const void* element(const void*, size_t) const { return unsupported<const void*>("element"); }
    virtual void* element_mut(void*, size_t) const { return unsupported<void*>("element_mut"); }

    // ------------------------------------------------------------------
    // Polymorphic. Variants are numbered in declaration order, matching
    // the mapping order of the field's PolyInfo.
    // ------------------------------------------------------------------

    // Variant number of the current occupant, -1 when empty or unmapped
    virtual int occupant_variant(const void*) const { return unsupported<int>("occupant_variant"); }

    virtual std::string occupant_type_name(const void*) const { return unsupported<std::string>("occupant_type_name"); }

    virtual const void* occupant(const void*, int) const { return unsupported<const void*>("occupant"); }

    // Replaces the occupant with a default-constructed variant
    virtual void* emplace_variant(void*, int) const { return unsupported<void*>("emplace_variant"); }

    // ------------------------------------------------------------------
    // Generic slot
    // ------------------------------------------------------------------

    virtual const BitSerializable& generic(const void*) const { return *unsupported<const BitSerializable*>("generic"); }
    virtual BitSerializable& generic_mut(void*) const { return *unsupported<BitSerializable*>("generic_mut"); }

private:
    template <typename R>
    static R unsupported(const char* what) {
        throw std::logic_error(std::string("FieldAccessor::") + what + " not supported for this field kind");
    }
};

} // namespace codec

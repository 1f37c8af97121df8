// src/codec/bit_serializable.hpp
#pragma once

#include <cstddef>
#include <cstdint>

namespace codec {

/**
 * BitSerializable - the shared serialization capability.
 *
 * A member whose type implements this interface is a generic slot: its
 * length is not known when the enclosing layout is built, so the codec
 * asks the occupant to encode itself and uses the bit count it reports.
 * Every method returns the number of bits written or read.
 *
 * Described records get an implementation from codec::Serializable<T>.
 */
class BitSerializable {
public:
    virtual ~BitSerializable() = default;

    virtual size_t serialize_msb(uint8_t* data, size_t data_len, size_t bit_offset) const = 0;
    virtual size_t serialize_lsb(uint8_t* data, size_t data_len, size_t bit_offset) const = 0;

    virtual size_t deserialize_msb(const uint8_t* data, size_t data_len, size_t bit_offset) = 0;
    virtual size_t deserialize_lsb(const uint8_t* data, size_t data_len, size_t bit_offset) = 0;

    virtual size_t total_bit_length() const = 0;
};

} // namespace codec

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

#include "codec/codec_error.hpp"

namespace utils
{

    // Bit numbering conventions for a bit range [start_bit, start_bit + bit_length):
    //
    // Lsb: start_bit = 0 is the LSB of byte[0], start_bit = 7 its MSB,
    //      start_bit = 8 the LSB of byte[1]. Field bit 0 (value LSB) sits at
    //      the lowest buffer position.
    //
    // Msb: start_bit = 0 is the MSB of byte[0] (first bit on the wire),
    //      start_bit = 7 its LSB. The field's most significant bit is stored
    //      first.
    enum class BitOrder
    {
        Lsb,
        Msb
    };

    const char *to_string(BitOrder order);

    // Read up to 64 bits into uint64_t. Throws codec::CodecError
    // (BitRangeOutOfBounds) when bit_length is outside [1, 64] or the range
    // runs past data_len.
    template <BitOrder Order>
    uint64_t get_bits(const uint8_t *data, size_t data_len,
                      size_t start_bit, int bit_length);

    // Write the low bit_length bits of value. Bits outside the range, in the
    // touched bytes, are preserved.
    template <BitOrder Order>
    void set_bits(uint8_t *data, size_t data_len,
                  size_t start_bit, int bit_length, uint64_t value);

    template <>
    uint64_t get_bits<BitOrder::Lsb>(const uint8_t *data, size_t data_len,
                                     size_t start_bit, int bit_length);
    template <>
    uint64_t get_bits<BitOrder::Msb>(const uint8_t *data, size_t data_len,
                                     size_t start_bit, int bit_length);
    template <>
    void set_bits<BitOrder::Lsb>(uint8_t *data, size_t data_len,
                                 size_t start_bit, int bit_length, uint64_t value);
    template <>
    void set_bits<BitOrder::Msb>(uint8_t *data, size_t data_len,
                                 size_t start_bit, int bit_length, uint64_t value);

    // Runtime-order forms, for callers at the outer boundary
    uint64_t get_bits(const uint8_t *data, size_t data_len,
                      size_t start_bit, int bit_length, BitOrder order);

    void set_bits(uint8_t *data, size_t data_len,
                  size_t start_bit, int bit_length, BitOrder order,
                  uint64_t value);

    // ------------------------------------------------------------------
    // Numeric reinterpretation: raw bit copy through the unsigned type of
    // the same width. No sign extension and no two's-complement fix-up for
    // partial widths.
    // ------------------------------------------------------------------

    template <typename T, typename = void>
    struct integral_of
    {
        using type = T;
    };

    template <typename T>
    struct integral_of<T, typename std::enable_if<std::is_enum<T>::value>::type>
    {
        using type = typename std::underlying_type<T>::type;
    };

    template <typename T>
    constexpr int natural_bits()
    {
        return static_cast<int>(sizeof(typename integral_of<T>::type) * 8);
    }

    template <typename T>
    uint64_t to_raw_bits(T value)
    {
        using I = typename integral_of<T>::type;
        using U = typename std::make_unsigned<I>::type;
        return static_cast<uint64_t>(static_cast<U>(static_cast<I>(value)));
    }

    template <typename T>
    T from_raw_bits(uint64_t raw)
    {
        using I = typename integral_of<T>::type;
        using U = typename std::make_unsigned<I>::type;
        return static_cast<T>(static_cast<I>(static_cast<U>(raw)));
    }

    // Throws codec::CodecError (BitRangeOutOfBounds) when bit_length is 0 or
    // wider than natural_width. The message names owner, or owner.field.
    void check_width(size_t bit_length, int natural_width, const char *owner,
                     const char *field = nullptr);

    template <BitOrder Order, typename T>
    T read_as(const uint8_t *data, size_t data_len, size_t start_bit, int bit_length)
    {
        check_width(static_cast<size_t>(bit_length), natural_bits<T>(), "read");
        return from_raw_bits<T>(get_bits<Order>(data, data_len, start_bit, bit_length));
    }

    template <BitOrder Order, typename T>
    void write_as(uint8_t *data, size_t data_len, size_t start_bit, int bit_length, T value)
    {
        check_width(static_cast<size_t>(bit_length), natural_bits<T>(), "write");
        set_bits<Order>(data, data_len, start_bit, bit_length, to_raw_bits(value));
    }

} // namespace utils

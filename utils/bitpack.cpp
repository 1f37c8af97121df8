#include "bitpack.hpp"

namespace utils
{

    static inline uint64_t low_mask(int n)
    {
        return n >= 64 ? ~0ULL : ((1ULL << n) - 1ULL);
    }

    static inline void check_range(size_t data_len, size_t start_bit, int bit_length)
    {
        if (bit_length < 1 || bit_length > 64)
        {
            throw codec::CodecError(codec::ErrorKind::BitRangeOutOfBounds,
                                    "bit length " + std::to_string(bit_length) +
                                        " outside [1, 64]");
        }
        const size_t end_bit = start_bit + static_cast<size_t>(bit_length);
        if (end_bit > data_len * 8)
        {
            throw codec::CodecError(codec::ErrorKind::BitRangeOutOfBounds,
                                    "bits [" + std::to_string(start_bit) + ", " +
                                        std::to_string(end_bit) + ") exceed buffer of " +
                                        std::to_string(data_len) + " bytes");
        }
    }

    static inline uint64_t load_le64(const uint8_t *p)
    {
        uint64_t w = 0;
        for (int i = 7; i >= 0; --i)
            w = (w << 8) | p[i];
        return w;
    }

    static inline uint64_t load_be64(const uint8_t *p)
    {
        uint64_t w = 0;
        for (int i = 0; i < 8; ++i)
            w = (w << 8) | p[i];
        return w;
    }

    static inline void store_le64(uint8_t *p, uint64_t w)
    {
        for (int i = 0; i < 8; ++i)
        {
            p[i] = static_cast<uint8_t>(w & 0xFFu);
            w >>= 8;
        }
    }

    static inline void store_be64(uint8_t *p, uint64_t w)
    {
        for (int i = 7; i >= 0; --i)
        {
            p[i] = static_cast<uint8_t>(w & 0xFFu);
            w >>= 8;
        }
    }

    // The whole range fits in the 8-byte word starting at its first byte
    static inline bool fits_word(size_t data_len, size_t start_bit, int bit_length)
    {
        const size_t byte_i = start_bit / 8;
        const int shift = static_cast<int>(start_bit % 8);
        return byte_i + 8 <= data_len && shift + bit_length <= 64;
    }

    const char *to_string(BitOrder order)
    {
        return order == BitOrder::Msb ? "MSB" : "LSB";
    }

    void check_width(size_t bit_length, int natural_width, const char *owner, const char *field)
    {
        if (bit_length < 1 || bit_length > static_cast<size_t>(natural_width))
        {
            std::string where(owner);
            if (field)
                where += std::string(".") + field;
            throw codec::CodecError(codec::ErrorKind::BitRangeOutOfBounds,
                                    where + ": " + std::to_string(bit_length) +
                                        " bits do not fit a " + std::to_string(natural_width) +
                                        "-bit value");
        }
    }

    template <>
    uint64_t get_bits<BitOrder::Lsb>(const uint8_t *data, size_t data_len,
                                     size_t start_bit, int bit_length)
    {
        check_range(data_len, start_bit, bit_length);

        if (fits_word(data_len, start_bit, bit_length))
        {
            const uint64_t w = load_le64(data + start_bit / 8);
            return (w >> (start_bit % 8)) & low_mask(bit_length);
        }

        const size_t end_bit = start_bit + static_cast<size_t>(bit_length);
        uint64_t out = 0;
        for (size_t b = start_bit / 8; b <= (end_bit - 1) / 8; ++b)
        {
            const size_t byte_lo = b * 8;
            const int lo = static_cast<int>((start_bit > byte_lo ? start_bit : byte_lo) - byte_lo);
            const int hi = static_cast<int>((end_bit < byte_lo + 8 ? end_bit : byte_lo + 8) - byte_lo);
            const uint64_t chunk = (static_cast<uint64_t>(data[b]) >> lo) & low_mask(hi - lo);
            out |= chunk << (byte_lo + lo - start_bit);
        }
        return out;
    }

    template <>
    uint64_t get_bits<BitOrder::Msb>(const uint8_t *data, size_t data_len,
                                     size_t start_bit, int bit_length)
    {
        check_range(data_len, start_bit, bit_length);

        if (fits_word(data_len, start_bit, bit_length))
        {
            const uint64_t w = load_be64(data + start_bit / 8);
            const int rshift = 64 - static_cast<int>(start_bit % 8) - bit_length;
            return (w >> rshift) & low_mask(bit_length);
        }

        // Stream bit k of a byte is physical bit (7 - k)
        const size_t end_bit = start_bit + static_cast<size_t>(bit_length);
        uint64_t out = 0;
        for (size_t b = start_bit / 8; b <= (end_bit - 1) / 8; ++b)
        {
            const size_t byte_lo = b * 8;
            const int lo = static_cast<int>((start_bit > byte_lo ? start_bit : byte_lo) - byte_lo);
            const int hi = static_cast<int>((end_bit < byte_lo + 8 ? end_bit : byte_lo + 8) - byte_lo);
            const int n = hi - lo;
            const uint64_t chunk = (static_cast<uint64_t>(data[b]) >> (8 - hi)) & low_mask(n);
            out = (out << n) | chunk;
        }
        return out;
    }

    template <>
    void set_bits<BitOrder::Lsb>(uint8_t *data, size_t data_len,
                                 size_t start_bit, int bit_length, uint64_t value)
    {
        check_range(data_len, start_bit, bit_length);
        value &= low_mask(bit_length);

        if (fits_word(data_len, start_bit, bit_length))
        {
            uint8_t *p = data + start_bit / 8;
            const int shift = static_cast<int>(start_bit % 8);
            const uint64_t mask = low_mask(bit_length) << shift;
            const uint64_t w = load_le64(p);
            store_le64(p, (w & ~mask) | ((value << shift) & mask));
            return;
        }

        const size_t end_bit = start_bit + static_cast<size_t>(bit_length);
        for (size_t b = start_bit / 8; b <= (end_bit - 1) / 8; ++b)
        {
            const size_t byte_lo = b * 8;
            const int lo = static_cast<int>((start_bit > byte_lo ? start_bit : byte_lo) - byte_lo);
            const int hi = static_cast<int>((end_bit < byte_lo + 8 ? end_bit : byte_lo + 8) - byte_lo);
            const int n = hi - lo;
            const uint8_t mask = static_cast<uint8_t>(low_mask(n) << lo);
            const uint8_t bits = static_cast<uint8_t>(
                ((value >> (byte_lo + lo - start_bit)) & low_mask(n)) << lo);
            data[b] = static_cast<uint8_t>((data[b] & ~mask) | bits);
        }
    }

    template <>
    void set_bits<BitOrder::Msb>(uint8_t *data, size_t data_len,
                                 size_t start_bit, int bit_length, uint64_t value)
    {
        check_range(data_len, start_bit, bit_length);
        value &= low_mask(bit_length);

        if (fits_word(data_len, start_bit, bit_length))
        {
            uint8_t *p = data + start_bit / 8;
            const int lshift = 64 - static_cast<int>(start_bit % 8) - bit_length;
            const uint64_t mask = low_mask(bit_length) << lshift;
            const uint64_t w = load_be64(p);
            store_be64(p, (w & ~mask) | ((value << lshift) & mask));
            return;
        }

        const size_t end_bit = start_bit + static_cast<size_t>(bit_length);
        for (size_t b = start_bit / 8; b <= (end_bit - 1) / 8; ++b)
        {
            const size_t byte_lo = b * 8;
            const int lo = static_cast<int>((start_bit > byte_lo ? start_bit : byte_lo) - byte_lo);
            const int hi = static_cast<int>((end_bit < byte_lo + 8 ? end_bit : byte_lo + 8) - byte_lo);
            const int n = hi - lo;
            // value bits still to be written after this byte
            const size_t remaining = end_bit - (byte_lo + hi);
            const uint64_t chunk = (value >> remaining) & low_mask(n);
            const uint8_t mask = static_cast<uint8_t>(low_mask(n) << (8 - hi));
            data[b] = static_cast<uint8_t>((data[b] & ~mask) | (chunk << (8 - hi)));
        }
    }

    uint64_t get_bits(const uint8_t *data, size_t data_len,
                      size_t start_bit, int bit_length, BitOrder order)
    {
        if (order == BitOrder::Msb)
            return get_bits<BitOrder::Msb>(data, data_len, start_bit, bit_length);
        return get_bits<BitOrder::Lsb>(data, data_len, start_bit, bit_length);
    }

    void set_bits(uint8_t *data, size_t data_len,
                  size_t start_bit, int bit_length, BitOrder order,
                  uint64_t value)
    {
        if (order == BitOrder::Msb)
            set_bits<BitOrder::Msb>(data, data_len, start_bit, bit_length, value);
        else
            set_bits<BitOrder::Lsb>(data, data_len, start_bit, bit_length, value);
    }

} // namespace utils

// src/codec/bit_serializer.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "codec/bit_serializable.hpp"
#include "codec/codec_engine.hpp"
#include "codec/codec_error.hpp"
#include "codec/record_schema.hpp"
#include "utils/bitpack.hpp"

namespace codec {

/**
 * BitSerializer - entry points for described records, one family per bit
 * order.
 *
 *   auto bytes = codec::MsbSerializer::serialize(msg);
 *   auto back  = codec::MsbSerializer::deserialize<Msg>(bytes);
 *
 * Buffers produced here are zero-filled, so bits inside the byte span that
 * no field covers (polymorphic slot padding, the tail of the last byte)
 * read back as zero.
 */
template <utils::BitOrder Order>
class BitSerializer {
public:
    template <typename T>
    static std::vector<uint8_t> serialize(const T& value, const CodecOptions& options = CodecOptions()) {
        const LayoutPtr layout = layout_of<T>();
        const size_t bits = measure_bits(*layout, &value, options);

        std::vector<uint8_t> out((bits + 7) / 8, 0);
        CodecEngine<Order>::serialize(*layout, &value, out.data(), out.size(), 0, options);
        return out;
    }

    // Fails with BufferTooSmall before touching out
    template <typename T>
    static void serialize(const T& value, uint8_t* out, size_t out_len,
                          const CodecOptions& options = CodecOptions()) {
        serialize_into(value, out, out_len, 0, options);
    }

    // Writes starting at bit_offset; returns the number of bits written
    template <typename T>
    static size_t serialize_into(const T& value, uint8_t* out, size_t out_len, size_t bit_offset,
                                 const CodecOptions& options = CodecOptions()) {
        const LayoutPtr layout = layout_of<T>();
        const size_t bits = measure_bits(*layout, &value, options);
        const size_t needed = (bit_offset + bits + 7) / 8;
        if (out_len < needed) {
            throw CodecError(ErrorKind::BufferTooSmall,
                             layout->type_name + " needs " + std::to_string(needed) +
                             " bytes, buffer holds " + std::to_string(out_len));
        }
        return CodecEngine<Order>::serialize(*layout, &value, out, out_len, bit_offset, options);
    }

    template <typename T>
    static T deserialize(const uint8_t* data, size_t data_len, const CodecOptions& options = CodecOptions()) {
        T value{};
        deserialize_into(value, data, data_len, 0, options);
        return value;
    }

    template <typename T>
    static T deserialize(const std::vector<uint8_t>& bytes, const CodecOptions& options = CodecOptions()) {
        return deserialize<T>(bytes.data(), bytes.size(), options);
    }

    // Reads starting at bit_offset; returns the number of bits consumed
    template <typename T>
    static size_t deserialize_into(T& value, const uint8_t* data, size_t data_len, size_t bit_offset,
                                   const CodecOptions& options = CodecOptions()) {
        const LayoutPtr layout = layout_of<T>();
        return CodecEngine<Order>::deserialize(*layout, &value, data, data_len, bit_offset, options);
    }

    template <typename T>
    static size_t bit_length(const T& value, const CodecOptions& options = CodecOptions()) {
        return measure_bits(*layout_of<T>(), &value, options);
    }
};

using MsbSerializer = BitSerializer<utils::BitOrder::Msb>;
using LsbSerializer = BitSerializer<utils::BitOrder::Lsb>;

/**
 * Serializable - gives a described record the BitSerializable capability
 * so it can occupy a generic slot.
 *
 *   struct Header : codec::Serializable<Header> {
 *       uint8_t id = 0;
 *       static void describe(codec::RecordSchema<Header>& s) { ... }
 *   };
 */
template <typename Derived>
class Serializable : public BitSerializable {
public:
    size_t serialize_msb(uint8_t* data, size_t data_len, size_t bit_offset) const override {
        return CodecEngine<utils::BitOrder::Msb>::serialize(*layout_of<Derived>(), self(), data, data_len, bit_offset);
    }

    size_t serialize_lsb(uint8_t* data, size_t data_len, size_t bit_offset) const override {
        return CodecEngine<utils::BitOrder::Lsb>::serialize(*layout_of<Derived>(), self(), data, data_len, bit_offset);
    }

    size_t deserialize_msb(const uint8_t* data, size_t data_len, size_t bit_offset) override {
        return CodecEngine<utils::BitOrder::Msb>::deserialize(*layout_of<Derived>(), self(), data, data_len, bit_offset);
    }

    size_t deserialize_lsb(const uint8_t* data, size_t data_len, size_t bit_offset) override {
        return CodecEngine<utils::BitOrder::Lsb>::deserialize(*layout_of<Derived>(), self(), data, data_len, bit_offset);
    }

    size_t total_bit_length() const override {
        return measure_bits(*layout_of<Derived>(), self());
    }

private:
    const void* self() const { return static_cast<const Derived*>(this); }
    void* self() { return static_cast<Derived*>(this); }
};

} // namespace codec

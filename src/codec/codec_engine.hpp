// src/codec/codec_engine.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "codec/type_layout.hpp"
#include "utils/bitpack.hpp"

namespace codec {

// How strictly a list count field or a discriminator field must agree
// with the object being serialized.
//
// Strict:  the count field equals the list size; the discriminator equals
//          the mapped value of the slot's occupant.
// Lenient: the count field is authoritative and may be smaller than the
//          list (extra elements are not written); the discriminator is
//          written as-is.
enum class RelatedFieldPolicy {
    Strict,
    Lenient
};

const char* to_string(RelatedFieldPolicy policy);
RelatedFieldPolicy parse_related_field_policy(const std::string& s);

struct CodecOptions {
    RelatedFieldPolicy related_field_policy = RelatedFieldPolicy::Strict;
};

/**
 * CodecEngine - walks a TypeLayout over a live record.
 *
 * Both directions return the number of bits the record occupies starting
 * at bit_offset. The caller owns buffer sizing; an access past data_len
 * raises BitRangeOutOfBounds.
 */
template <utils::BitOrder Order>
class CodecEngine {
public:
    static size_t serialize(const TypeLayout& layout, const void* obj,
                            uint8_t* data, size_t data_len, size_t bit_offset,
                            const CodecOptions& options = CodecOptions());

    static size_t deserialize(const TypeLayout& layout, void* obj,
                              const uint8_t* data, size_t data_len, size_t bit_offset,
                              const CodecOptions& options = CodecOptions());
};

extern template class CodecEngine<utils::BitOrder::Msb>;
extern template class CodecEngine<utils::BitOrder::Lsb>;

// Exact encoded length of obj in bits. Equal to the static length unless
// the layout has a dynamic tail.
size_t measure_bits(const TypeLayout& layout, const void* obj,
                    const CodecOptions& options = CodecOptions());

} // namespace codec

// src/codec/codec_engine.cpp
#include "codec/codec_engine.hpp"
#include "codec/bit_serializable.hpp"
#include "codec/codec_error.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <stdexcept>

namespace codec {

const char* to_string(RelatedFieldPolicy policy) {
    switch (policy) {
        case RelatedFieldPolicy::Strict:  return "strict";
        case RelatedFieldPolicy::Lenient: return "lenient";
    }
    return "unknown";
}

RelatedFieldPolicy parse_related_field_policy(const std::string& s) {
    std::string lower;
    for (char c : s) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "strict") {
        return RelatedFieldPolicy::Strict;
    }
    if (lower == "lenient") {
        return RelatedFieldPolicy::Lenient;
    }
    throw std::invalid_argument("Unknown related field policy: " + s);
}

namespace {

using utils::BitOrder;

// Tracks where the next field starts. Until the first runtime-length field
// every offset is static; after it, offsets are relative to the end of the
// most recent runtime-length field.
class Cursor {
public:
    explicit Cursor(size_t base) : base_(base) {}

    size_t start_of(const FieldDescriptor& f) const {
        return f.offset_is_static ? base_ + f.static_bit_offset : anchor_ + f.anchor_delta;
    }

    void close_dynamic(size_t end) { anchor_ = end; after_dynamic_ = true; }

    size_t end_of(const TypeLayout& layout) const {
        return after_dynamic_ ? anchor_ + layout.trailing_static_bits
                              : base_ + layout.total_static_bit_length;
    }

private:
    size_t base_;
    size_t anchor_ = 0;
    bool after_dynamic_ = false;
};

std::string field_ref(const TypeLayout& layout, const FieldDescriptor& f) {
    return layout.type_name + "." + f.name;
}

uint64_t convert(const TypeLayout& layout, const FieldDescriptor& f, uint64_t value, bool to_raw) {
    try {
        return to_raw ? f.converter->to_raw(value) : f.converter->to_logical(value);
    } catch (const CodecError&) {
        throw;
    } catch (const std::exception& e) {
        throw CodecError(ErrorKind::ConverterFailed,
                         field_ref(layout, f) + ": converter " + f.converter->name() + " failed: " + e.what());
    }
}

// Number of elements to write for a list field
size_t count_for_write(const TypeLayout& layout, const FieldDescriptor& f,
                       const void* obj, const CodecOptions& options) {
    const ListInfo& li = *f.list;
    const bool strict = options.related_field_policy == RelatedFieldPolicy::Strict;
    const size_t held = f.accessor->size(obj);

    if (li.fixed_count) {
        const size_t count = *li.fixed_count;
        if (li.is_array_like) {
            return count;
        }
        if (held < count || (strict && held != count)) {
            throw CodecError(ErrorKind::CountMismatch,
                             field_ref(layout, f) + " holds " + std::to_string(held) +
                             " elements, fixed count is " + std::to_string(count));
        }
        return count;
    }

    const FieldDescriptor& count_field = layout.fields[li.count_field_index];
    const int64_t declared = count_field.accessor->get_integer(obj);
    if (declared < 0) {
        throw CodecError(ErrorKind::CountMismatch,
                         field_ref(layout, f) + ": count field '" + count_field.name +
                         "' is negative (" + std::to_string(declared) + ")");
    }

    const size_t count = static_cast<size_t>(declared);
    if (li.is_array_like) {
        if (count > held) {
            throw CodecError(ErrorKind::CountMismatch,
                             field_ref(layout, f) + ": count " + std::to_string(count) +
                             " exceeds array capacity " + std::to_string(held));
        }
    } else if (count > held || (strict && count != held)) {
        throw CodecError(ErrorKind::CountMismatch,
                         field_ref(layout, f) + " holds " + std::to_string(held) +
                         " elements, count field '" + count_field.name + "' says " +
                         std::to_string(count));
    }
    return count;
}

// Element count taken from the already-decoded record
size_t count_for_read(const TypeLayout& layout, const FieldDescriptor& f, const void* obj) {
    const ListInfo& li = *f.list;
    if (li.fixed_count) {
        return *li.fixed_count;
    }

    const FieldDescriptor& count_field = layout.fields[li.count_field_index];
    const int64_t declared = count_field.accessor->get_integer(obj);
    if (declared < 0) {
        throw CodecError(ErrorKind::CountMismatch,
                         field_ref(layout, f) + ": decoded count '" + count_field.name +
                         "' is negative (" + std::to_string(declared) + ")");
    }
    const size_t count = static_cast<size_t>(declared);
    if (li.is_array_like && count > li.capacity) {
        throw CodecError(ErrorKind::CountMismatch,
                         field_ref(layout, f) + ": decoded count " + std::to_string(count) +
                         " exceeds array capacity " + std::to_string(li.capacity));
    }
    return count;
}

// Mapping index of the slot's current occupant
int variant_for_write(const TypeLayout& layout, const FieldDescriptor& f,
                      const void* obj, const CodecOptions& options) {
    const PolyInfo& pi = *f.poly;
    const int variant = f.accessor->occupant_variant(obj);
    if (variant < 0) {
        throw CodecError(ErrorKind::UnknownVariant,
                         field_ref(layout, f) + ": occupant " + f.accessor->occupant_type_name(obj) +
                         " has no discriminator mapping");
    }

    if (options.related_field_policy == RelatedFieldPolicy::Strict) {
        const PolyMapping& m = pi.mappings[static_cast<size_t>(variant)];
        const int64_t disc = layout.fields[pi.discriminator_index].accessor->get_integer(obj);
        if (disc != m.discriminator) {
            throw CodecError(ErrorKind::DiscriminatorMismatch,
                             field_ref(layout, f) + ": discriminator '" + pi.discriminator_field_name +
                             "' is " + std::to_string(disc) + " but occupant " + m.type_name +
                             " maps to " + std::to_string(m.discriminator));
        }
    }
    return variant;
}

// A decoded count is untrusted: its elements must fit the remaining buffer
// before any storage is allocated for them.
void check_list_fits(const TypeLayout& layout, const FieldDescriptor& f,
                     size_t count, size_t step, size_t len, size_t start) {
    const size_t total_bits = len * 8;
    const size_t available = total_bits > start ? total_bits - start : 0;
    if (count > available / step) {
        throw CodecError(ErrorKind::BitRangeOutOfBounds,
                         field_ref(layout, f) + ": " + std::to_string(count) + " elements of " +
                         std::to_string(step) + " bits exceed the " + std::to_string(available) +
                         " bits left in the buffer");
    }
}

void check_slot(const TypeLayout& layout, const FieldDescriptor& f, size_t used) {
    if (used > f.poly->slot_bit_length) {
        throw CodecError(ErrorKind::BitRangeOutOfBounds,
                         field_ref(layout, f) + ": variant needs " + std::to_string(used) +
                         " bits, slot holds " + std::to_string(f.poly->slot_bit_length));
    }
}

template <BitOrder Order>
size_t serialize_generic(const BitSerializable& g, uint8_t* data, size_t len, size_t start) {
    if constexpr (Order == BitOrder::Msb) {
        return g.serialize_msb(data, len, start);
    } else {
        return g.serialize_lsb(data, len, start);
    }
}

template <BitOrder Order>
size_t deserialize_generic(BitSerializable& g, const uint8_t* data, size_t len, size_t start) {
    if constexpr (Order == BitOrder::Msb) {
        return g.deserialize_msb(data, len, start);
    } else {
        return g.deserialize_lsb(data, len, start);
    }
}

// ============================================================================
// Serialize
// ============================================================================

template <BitOrder Order>
size_t write_record(const TypeLayout& layout, const void* obj,
                    uint8_t* data, size_t len, size_t bit_offset,
                    const CodecOptions& options) {
    Cursor cursor(bit_offset);

    for (const auto& f : layout.fields) {
        const size_t start = cursor.start_of(f);

        switch (f.kind) {
            case FieldKind::Primitive:
            case FieldKind::Enum: {
                utils::check_width(f.bit_length, f.accessor->natural_bits(), layout.type_name.c_str(), f.name.c_str());
                uint64_t raw = f.accessor->get_raw(obj);
                if (f.converter) {
                    raw = convert(layout, f, raw, true);
                }
                utils::set_bits<Order>(data, len, start, static_cast<int>(f.bit_length), raw);
                break;
            }

            case FieldKind::Nested: {
                const size_t used = write_record<Order>(*f.nested, f.accessor->nested(obj),
                                                        data, len, start, options);
                if (f.dynamic_length) {
                    cursor.close_dynamic(start + used);
                }
                break;
            }

            case FieldKind::List: {
                const ListInfo& li = *f.list;
                const size_t count = count_for_write(layout, f, obj, options);
                const size_t step = li.element_bit_length;

                if (li.element_kind == FieldKind::Nested) {
                    for (size_t i = 0; i < count; ++i) {
                        write_record<Order>(*li.element_layout, f.accessor->element(obj, i),
                                            data, len, start + i * step, options);
                    }
                } else {
                    utils::check_width(step, f.accessor->element_natural_bits(), layout.type_name.c_str(), f.name.c_str());
                    for (size_t i = 0; i < count; ++i) {
                        utils::set_bits<Order>(data, len, start + i * step, static_cast<int>(step),
                                               f.accessor->get_element_raw(obj, i));
                    }
                }

                if (f.dynamic_length) {
                    cursor.close_dynamic(start + count * step);
                }
                break;
            }

            case FieldKind::Polymorphic: {
                const int variant = variant_for_write(layout, f, obj, options);
                const PolyMapping& m = f.poly->mappings[static_cast<size_t>(variant)];
                const void* occupant = f.accessor->occupant(obj, variant);
                check_slot(layout, f, measure_bits(*m.layout, occupant, options));
                write_record<Order>(*m.layout, occupant, data, len, start, options);
                break;
            }

            case FieldKind::GenericSlot: {
                const size_t used = serialize_generic<Order>(f.accessor->generic(obj), data, len, start);
                cursor.close_dynamic(start + used);
                break;
            }
        }
    }

    return cursor.end_of(layout) - bit_offset;
}

// ============================================================================
// Deserialize
// ============================================================================

template <BitOrder Order>
size_t read_record(const TypeLayout& layout, void* obj,
                   const uint8_t* data, size_t len, size_t bit_offset,
                   const CodecOptions& options) {
    Cursor cursor(bit_offset);

    for (const auto& f : layout.fields) {
        const size_t start = cursor.start_of(f);

        switch (f.kind) {
            case FieldKind::Primitive:
            case FieldKind::Enum: {
                utils::check_width(f.bit_length, f.accessor->natural_bits(), layout.type_name.c_str(), f.name.c_str());
                uint64_t raw = utils::get_bits<Order>(data, len, start, static_cast<int>(f.bit_length));
                if (f.converter) {
                    raw = convert(layout, f, raw, false);
                }
                f.accessor->set_raw(obj, raw);
                break;
            }

            case FieldKind::Nested: {
                const size_t used = read_record<Order>(*f.nested, f.accessor->nested_mut(obj),
                                                       data, len, start, options);
                if (f.dynamic_length) {
                    cursor.close_dynamic(start + used);
                }
                break;
            }

            case FieldKind::List: {
                const ListInfo& li = *f.list;
                const size_t count = count_for_read(layout, f, obj);
                const size_t step = li.element_bit_length;
                check_list_fits(layout, f, count, step, len, start);
                f.accessor->resize(obj, count);

                if (li.element_kind == FieldKind::Nested) {
                    for (size_t i = 0; i < count; ++i) {
                        read_record<Order>(*li.element_layout, f.accessor->element_mut(obj, i),
                                           data, len, start + i * step, options);
                    }
                } else {
                    utils::check_width(step, f.accessor->element_natural_bits(), layout.type_name.c_str(), f.name.c_str());
                    for (size_t i = 0; i < count; ++i) {
                        f.accessor->set_element_raw(obj, i,
                            utils::get_bits<Order>(data, len, start + i * step, static_cast<int>(step)));
                    }
                }

                if (f.dynamic_length) {
                    cursor.close_dynamic(start + count * step);
                }
                break;
            }

            case FieldKind::Polymorphic: {
                const PolyInfo& pi = *f.poly;
                const int64_t disc = layout.fields[pi.discriminator_index].accessor->get_integer(obj);
                const int variant = pi.find(disc);
                if (variant < 0) {
                    throw CodecError(ErrorKind::UnknownVariant,
                                     field_ref(layout, f) + ": no variant mapped for " +
                                     pi.discriminator_field_name + " = " + std::to_string(disc));
                }
                const PolyMapping& m = pi.mappings[static_cast<size_t>(variant)];
                check_slot(layout, f, m.layout->total_static_bit_length);
                const size_t used = read_record<Order>(*m.layout, f.accessor->emplace_variant(obj, variant),
                                                       data, len, start, options);
                check_slot(layout, f, used);
                break;
            }

            case FieldKind::GenericSlot: {
                const size_t used = deserialize_generic<Order>(f.accessor->generic_mut(obj), data, len, start);
                cursor.close_dynamic(start + used);
                break;
            }
        }
    }

    return cursor.end_of(layout) - bit_offset;
}

} // namespace

template <BitOrder Order>
size_t CodecEngine<Order>::serialize(const TypeLayout& layout, const void* obj,
                                     uint8_t* data, size_t data_len, size_t bit_offset,
                                     const CodecOptions& options) {
    return write_record<Order>(layout, obj, data, data_len, bit_offset, options);
}

template <BitOrder Order>
size_t CodecEngine<Order>::deserialize(const TypeLayout& layout, void* obj,
                                       const uint8_t* data, size_t data_len, size_t bit_offset,
                                       const CodecOptions& options) {
    return read_record<Order>(layout, obj, data, data_len, bit_offset, options);
}

template class CodecEngine<BitOrder::Msb>;
template class CodecEngine<BitOrder::Lsb>;

size_t measure_bits(const TypeLayout& layout, const void* obj, const CodecOptions& options) {
    if (!layout.has_dynamic_tail) {
        return layout.total_static_bit_length;
    }

    Cursor cursor(0);
    for (const auto& f : layout.fields) {
        if (!f.dynamic_length) {
            continue;
        }
        const size_t start = cursor.start_of(f);

        switch (f.kind) {
            case FieldKind::Nested:
                cursor.close_dynamic(start + measure_bits(*f.nested, f.accessor->nested(obj), options));
                break;
            case FieldKind::List:
                cursor.close_dynamic(start + count_for_write(layout, f, obj, options) *
                                             f.list->element_bit_length);
                break;
            case FieldKind::GenericSlot:
                cursor.close_dynamic(start + f.accessor->generic(obj).total_bit_length());
                break;
            default:
                break;
        }
    }
    return cursor.end_of(layout);
}

} // namespace codec

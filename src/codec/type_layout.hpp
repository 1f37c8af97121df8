// src/codec/type_layout.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "codec/field_accessor.hpp"
#include "codec/value_converter.hpp"

namespace codec {

enum class FieldKind {
    Primitive,
    Enum,
    Nested,
    List,
    Polymorphic,
    GenericSlot
};

const char* to_string(FieldKind kind);

struct TypeLayout;
using LayoutPtr = std::shared_ptr<const TypeLayout>;

// List-specific part of a field
struct ListInfo {
    FieldKind element_kind = FieldKind::Primitive;
    size_t element_bit_length = 0;

    // Cardinality: a fixed count wins over a count field
    std::optional<uint32_t> fixed_count;
    std::string count_field_name;
    size_t count_field_index = 0;

    bool is_array_like = false;
    size_t capacity = 0;           // array-like only

    LayoutPtr element_layout;      // Nested elements only

    bool count_is_dynamic() const { return !fixed_count.has_value(); }
};

struct PolyMapping {
    int64_t discriminator = 0;
    std::string type_name;
    LayoutPtr layout;
};

// Polymorphic-specific part of a field
struct PolyInfo {
    std::string discriminator_field_name;
    size_t discriminator_index = 0;

    std::vector<PolyMapping> mappings;   // declaration order
    size_t slot_bit_length = 0;

    // Mapping index for a discriminator value, -1 if none
    int find(int64_t discriminator) const;
};

/**
 * FieldDescriptor - where one field lives and how it is encoded.
 *
 * static_bit_offset is the offset the field would have if every preceding
 * runtime-length field contributed zero bits. When offset_is_static is
 * false the field starts at (end of the last runtime-length field) +
 * anchor_delta instead.
 */
struct FieldDescriptor {
    std::string name;
    FieldKind kind = FieldKind::Primitive;

    size_t static_bit_offset = 0;
    bool offset_is_static = true;
    size_t anchor_delta = 0;

    // Static contribution of the field. Zero for runtime-length lists and
    // generic slots.
    size_t bit_length = 0;

    // True when the encoded length is only known at call time
    bool dynamic_length = false;

    LayoutPtr nested;                  // Nested only
    std::optional<ListInfo> list;      // List only
    std::optional<PolyInfo> poly;      // Polymorphic only

    std::shared_ptr<const ValueConverter> converter;
    std::shared_ptr<const FieldAccessor> accessor;
};

// Immutable description of a record type, shared by all threads
struct TypeLayout {
    std::string type_name;
    std::vector<FieldDescriptor> fields;   // base fields first

    size_t total_static_bit_length = 0;
    bool has_dynamic_tail = false;

    // Static bits declared after the last runtime-length field
    size_t trailing_static_bits = 0;

    LayoutPtr base_layout;

    const FieldDescriptor* find_field(const std::string& name) const;
};

// Human readable dump of a layout, one line per field
std::string describe_layout(const TypeLayout& layout);

} // namespace codec

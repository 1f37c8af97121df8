// src/codec/layout_builder.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "codec/type_layout.hpp"

namespace codec {

struct VariantDecl {
    int64_t discriminator = 0;
    std::function<LayoutPtr()> layout;
};

// Declaration of one member, as collected by RecordSchema<T>
struct FieldDecl {
    std::string name;
    std::string type_name;                 // member type, for messages

    // Empty when the member type has no encoding
    std::optional<FieldKind> kind;
    bool ignored = false;

    std::optional<size_t> bit_length;      // lists: per-element width
    int natural_bits = 0;                  // Primitive / Enum and primitive list elements
    std::optional<uint32_t> fixed_count;
    std::optional<std::string> related;    // count field or discriminator field

    // Lists
    std::optional<FieldKind> element_kind;
    bool is_array_like = false;
    size_t capacity = 0;

    // Nested type, or the element type of a nested list
    std::function<LayoutPtr()> layout;

    std::vector<VariantDecl> variants;

    std::shared_ptr<const ValueConverter> converter;
    std::string converter_error;           // set when the converter does not fit the member

    std::shared_ptr<const FieldAccessor> accessor;
};

struct RecordDecl {
    std::string type_name;
    std::vector<FieldDecl> fields;         // base fields first
    std::function<LayoutPtr()> base_layout;
};

/**
 * LayoutBuilder - turns a record declaration into a TypeLayout.
 *
 * One pass in declaration order: static offsets accumulate, and every
 * runtime-length field becomes the anchor for the fields after it.
 * Any declaration problem throws LayoutError naming the type and field.
 */
class LayoutBuilder {
public:
    static LayoutPtr build(const RecordDecl& decl);
};

} // namespace codec

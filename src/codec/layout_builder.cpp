// src/codec/layout_builder.cpp
#include "codec/layout_builder.hpp"
#include "codec/codec_error.hpp"
#include "utils/logging.hpp"

#include <algorithm>

namespace codec {

namespace {

[[noreturn]] void fail(ErrorKind kind, const std::string& type_name, const std::string& what) {
    LOG_WARN("[LayoutBuilder] %s: %s", type_name.c_str(), what.c_str());
    throw LayoutError(kind, type_name, what);
}

std::string field_ref(const FieldDecl& fd) {
    return "field '" + fd.name + "'";
}

// Resolves a related field among the fields already placed. Counts and
// discriminators must be Primitive or Enum and declared earlier.
size_t resolve_related(const RecordDecl& decl, const TypeLayout& layout,
                       const FieldDecl& fd, const std::string& related) {
    for (size_t i = 0; i < layout.fields.size(); ++i) {
        const FieldDescriptor& f = layout.fields[i];
        if (f.name != related) {
            continue;
        }
        if (f.kind != FieldKind::Primitive && f.kind != FieldKind::Enum) {
            fail(ErrorKind::RelatedFieldNotFound, decl.type_name,
                 field_ref(fd) + " refers to '" + related + "', which is " +
                 to_string(f.kind) + " instead of Primitive or Enum");
        }
        return i;
    }

    const bool declared_later = std::any_of(decl.fields.begin(), decl.fields.end(),
        [&](const FieldDecl& other) { return other.name == related && !other.ignored; });
    fail(ErrorKind::RelatedFieldNotFound, decl.type_name,
         field_ref(fd) + " refers to '" + related + "'" +
         (declared_later ? ", which is declared after it" : ", which does not exist"));
}

void build_scalar(const RecordDecl& decl, const FieldDecl& fd, FieldDescriptor& f) {
    f.bit_length = fd.bit_length.value_or(static_cast<size_t>(fd.natural_bits));
    if (f.bit_length == 0) {
        fail(ErrorKind::MissingFieldMetadata, decl.type_name, field_ref(fd) + " has no bit length");
    }
    f.converter = fd.converter;
}

// An explicit width for a nested record must hold the record's static bits
size_t nested_width(const RecordDecl& decl, const FieldDecl& fd, const TypeLayout& nested,
                    const char* what) {
    if (fd.bit_length && *fd.bit_length < nested.total_static_bit_length) {
        fail(ErrorKind::BitRangeOutOfBounds, decl.type_name,
             field_ref(fd) + " declares " + std::to_string(*fd.bit_length) + " bits, " + what +
             " " + nested.type_name + " needs " + std::to_string(nested.total_static_bit_length));
    }
    return fd.bit_length.value_or(nested.total_static_bit_length);
}

void build_nested(const RecordDecl& decl, const FieldDecl& fd, FieldDescriptor& f) {
    f.nested = fd.layout();
    f.bit_length = nested_width(decl, fd, *f.nested, "record");
    f.dynamic_length = f.nested->has_dynamic_tail;
}

void build_list(const RecordDecl& decl, const TypeLayout& layout,
                const FieldDecl& fd, FieldDescriptor& f) {
    if (!fd.element_kind) {
        fail(ErrorKind::UnsupportedFieldType, decl.type_name,
             field_ref(fd) + " has element type '" + fd.type_name + "' with no bit encoding");
    }

    ListInfo li;
    li.element_kind = *fd.element_kind;
    li.is_array_like = fd.is_array_like;
    li.capacity = fd.capacity;

    if (li.element_kind == FieldKind::Nested) {
        li.element_layout = fd.layout();
        if (li.element_layout->has_dynamic_tail) {
            fail(ErrorKind::MissingFieldMetadata, decl.type_name,
                 field_ref(fd) + " has elements of runtime length (" +
                 li.element_layout->type_name + ")");
        }
        li.element_bit_length = nested_width(decl, fd, *li.element_layout, "element");
    } else {
        li.element_bit_length = fd.bit_length.value_or(static_cast<size_t>(fd.natural_bits));
    }
    if (li.element_bit_length == 0) {
        fail(ErrorKind::MissingFieldMetadata, decl.type_name, field_ref(fd) + " has no element bit length");
    }

    if (fd.fixed_count) {
        li.fixed_count = fd.fixed_count;
        if (li.is_array_like && *fd.fixed_count > li.capacity) {
            fail(ErrorKind::CountMismatch, decl.type_name,
                 field_ref(fd) + " fixes " + std::to_string(*fd.fixed_count) +
                 " elements, array holds " + std::to_string(li.capacity));
        }
        f.bit_length = static_cast<size_t>(*fd.fixed_count) * li.element_bit_length;
    } else if (fd.related) {
        li.count_field_name = *fd.related;
        li.count_field_index = resolve_related(decl, layout, fd, *fd.related);
        f.bit_length = 0;
        f.dynamic_length = true;
    } else {
        fail(ErrorKind::ListMissingCardinality, decl.type_name,
             field_ref(fd) + " has neither a fixed count nor a count field");
    }

    f.list = li;
}

void build_polymorphic(const RecordDecl& decl, const TypeLayout& layout,
                       const FieldDecl& fd, FieldDescriptor& f) {
    if (!fd.related) {
        fail(ErrorKind::PolymorphicMissingDiscriminator, decl.type_name,
             field_ref(fd) + " has no discriminator field");
    }

    PolyInfo pi;
    pi.discriminator_field_name = *fd.related;
    pi.discriminator_index = resolve_related(decl, layout, fd, *fd.related);

    size_t widest = 0;
    for (const auto& v : fd.variants) {
        PolyMapping m;
        m.discriminator = v.discriminator;
        m.layout = v.layout();
        m.type_name = m.layout->type_name;
        widest = std::max(widest, m.layout->total_static_bit_length);
        pi.mappings.push_back(std::move(m));
    }

    if (fd.bit_length) {
        pi.slot_bit_length = *fd.bit_length;
    } else if (!pi.mappings.empty()) {
        pi.slot_bit_length = widest;
    } else {
        fail(ErrorKind::MissingFieldMetadata, decl.type_name,
             field_ref(fd) + " has no variants and no slot length");
    }

    f.bit_length = pi.slot_bit_length;
    f.poly = std::move(pi);
}

} // namespace

LayoutPtr LayoutBuilder::build(const RecordDecl& decl) {
    auto layout = std::make_shared<TypeLayout>();
    layout->type_name = decl.type_name;
    if (decl.base_layout) {
        layout->base_layout = decl.base_layout();
    }

    size_t cursor = 0;
    bool seen_dynamic = false;
    size_t anchor_static_end = 0;

    for (const auto& fd : decl.fields) {
        if (fd.ignored) {
            continue;
        }
        if (!fd.kind) {
            fail(ErrorKind::UnsupportedFieldType, decl.type_name,
                 field_ref(fd) + " has type '" + fd.type_name + "' with no bit encoding");
        }
        if (!fd.converter_error.empty()) {
            fail(ErrorKind::InvalidConverter, decl.type_name, field_ref(fd) + ": " + fd.converter_error);
        }

        FieldDescriptor f;
        f.name = fd.name;
        f.kind = *fd.kind;
        f.accessor = fd.accessor;
        f.static_bit_offset = cursor;
        f.offset_is_static = !seen_dynamic;
        f.anchor_delta = seen_dynamic ? cursor - anchor_static_end : 0;

        switch (f.kind) {
            case FieldKind::Primitive:
            case FieldKind::Enum:
                build_scalar(decl, fd, f);
                break;
            case FieldKind::Nested:
                build_nested(decl, fd, f);
                break;
            case FieldKind::List:
                build_list(decl, *layout, fd, f);
                break;
            case FieldKind::Polymorphic:
                build_polymorphic(decl, *layout, fd, f);
                break;
            case FieldKind::GenericSlot:
                f.bit_length = 0;
                f.dynamic_length = true;
                break;
        }

        cursor += f.bit_length;
        if (f.dynamic_length) {
            seen_dynamic = true;
            anchor_static_end = cursor;
        }
        layout->fields.push_back(std::move(f));
    }

    layout->total_static_bit_length = cursor;
    layout->has_dynamic_tail = seen_dynamic;
    layout->trailing_static_bits = seen_dynamic ? cursor - anchor_static_end : 0;

    LOG_DEBUG("[LayoutBuilder] %s: %zu fields, %zu static bits%s",
              layout->type_name.c_str(), layout->fields.size(),
              layout->total_static_bit_length,
              layout->has_dynamic_tail ? ", dynamic tail" : "");
    return layout;
}

} // namespace codec

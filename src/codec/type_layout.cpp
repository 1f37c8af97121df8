// src/codec/type_layout.cpp
#include "codec/type_layout.hpp"

#include <sstream>

namespace codec {

const char* to_string(FieldKind kind) {
    switch (kind) {
        case FieldKind::Primitive:   return "Primitive";
        case FieldKind::Enum:        return "Enum";
        case FieldKind::Nested:      return "Nested";
        case FieldKind::List:        return "List";
        case FieldKind::Polymorphic: return "Polymorphic";
        case FieldKind::GenericSlot: return "GenericSlot";
    }
    return "Unknown";
}

int PolyInfo::find(int64_t discriminator) const {
    for (size_t i = 0; i < mappings.size(); ++i) {
        if (mappings[i].discriminator == discriminator) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

const FieldDescriptor* TypeLayout::find_field(const std::string& name) const {
    for (const auto& f : fields) {
        if (f.name == name) {
            return &f;
        }
    }
    return nullptr;
}

std::string describe_layout(const TypeLayout& layout) {
    std::ostringstream os;
    os << layout.type_name << ": " << layout.total_static_bit_length << " static bits";
    if (layout.has_dynamic_tail) {
        os << " + dynamic tail (" << layout.trailing_static_bits << " trailing)";
    }
    if (layout.base_layout) {
        os << ", extends " << layout.base_layout->type_name;
    }
    os << "\n";

    for (const auto& f : layout.fields) {
        os << "  ";
        if (f.offset_is_static) {
            os << "@" << f.static_bit_offset;
        } else {
            os << "@anchor+" << f.anchor_delta;
        }
        os << " " << f.name << " " << to_string(f.kind);

        switch (f.kind) {
            case FieldKind::Primitive:
            case FieldKind::Enum:
                os << " " << f.bit_length << "b";
                if (f.converter) {
                    os << " via " << f.converter->name();
                }
                break;
            case FieldKind::Nested:
                os << " " << f.nested->type_name << " " << f.bit_length << "b";
                if (f.dynamic_length) {
                    os << "+";
                }
                break;
            case FieldKind::List: {
                const ListInfo& li = *f.list;
                os << " " << to_string(li.element_kind) << "[";
                if (li.fixed_count) {
                    os << *li.fixed_count;
                } else {
                    os << li.count_field_name;
                }
                os << "] x " << li.element_bit_length << "b";
                if (li.is_array_like) {
                    os << " cap " << li.capacity;
                }
                break;
            }
            case FieldKind::Polymorphic: {
                const PolyInfo& pi = *f.poly;
                os << " on " << pi.discriminator_field_name << " slot " << pi.slot_bit_length << "b {";
                for (size_t i = 0; i < pi.mappings.size(); ++i) {
                    if (i) os << ", ";
                    os << pi.mappings[i].discriminator << "=" << pi.mappings[i].type_name;
                }
                os << "}";
                break;
            }
            case FieldKind::GenericSlot:
                os << " runtime length";
                break;
        }
        os << "\n";
    }
    return os.str();
}

} // namespace codec

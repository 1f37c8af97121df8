// src/codec/codec_error.cpp
#include "codec/codec_error.hpp"

namespace codec {

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MissingFieldMetadata:
        return "MissingFieldMetadata";
    case ErrorKind::UnsupportedFieldType:
        return "UnsupportedFieldType";
    case ErrorKind::ListMissingCardinality:
        return "ListMissingCardinality";
    case ErrorKind::PolymorphicMissingDiscriminator:
        return "PolymorphicMissingDiscriminator";
    case ErrorKind::RelatedFieldNotFound:
        return "RelatedFieldNotFound";
    case ErrorKind::InvalidConverter:
        return "InvalidConverter";
    case ErrorKind::RecursiveLayout:
        return "RecursiveLayout";
    case ErrorKind::UnknownVariant:
        return "UnknownVariant";
    case ErrorKind::BufferTooSmall:
        return "BufferTooSmall";
    case ErrorKind::BitRangeOutOfBounds:
        return "BitRangeOutOfBounds";
    case ErrorKind::CountMismatch:
        return "CountMismatch";
    case ErrorKind::DiscriminatorMismatch:
        return "DiscriminatorMismatch";
    case ErrorKind::ConverterFailed:
        return "ConverterFailed";
    case ErrorKind::UnregisteredType:
        return "UnregisteredType";
    }
    return "Unknown";
}

CodecError::CodecError(ErrorKind kind, const std::string& what)
    : std::runtime_error(std::string("[") + to_string(kind) + "] " + what),
      kind_(kind) {}

LayoutError::LayoutError(ErrorKind kind, const std::string& type_name, const std::string& what)
    : CodecError(kind, "type '" + type_name + "': " + what),
      type_name_(type_name) {}

} // namespace codec

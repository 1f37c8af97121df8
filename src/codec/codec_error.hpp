// src/codec/codec_error.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace codec {

enum class ErrorKind {
    // Layout build time
    MissingFieldMetadata,
    UnsupportedFieldType,
    ListMissingCardinality,
    PolymorphicMissingDiscriminator,
    RelatedFieldNotFound,
    InvalidConverter,
    RecursiveLayout,

    // Call time
    UnknownVariant,
    BufferTooSmall,
    BitRangeOutOfBounds,
    CountMismatch,
    DiscriminatorMismatch,
    ConverterFailed,

    // Outer registry
    UnregisteredType
};

const char* to_string(ErrorKind kind);

/**
 * CodecError - every failure raised by the codec carries its kind.
 *
 * Layout problems are raised as LayoutError so callers can tell a broken
 * declaration apart from a bad buffer or object at call time.
 */
class CodecError : public std::runtime_error {
public:
    CodecError(ErrorKind kind, const std::string& what);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class LayoutError : public CodecError {
public:
    LayoutError(ErrorKind kind, const std::string& type_name, const std::string& what);

    const std::string& type_name() const { return type_name_; }

private:
    std::string type_name_;
};

} // namespace codec

// src/codec/value_converter.hpp
#pragma once

#include <cstdint>
#include <string>

namespace codec {

// Bidirectional transform between a field's wire value and its logical
// value. Both values travel as raw bit copies of the field's member type.
// Implementations must be pure.
class ValueConverter {
public:
    virtual ~ValueConverter() = default;

    // Called right before the bits are written
    virtual uint64_t to_raw(uint64_t logical) const = 0;

    // Called right after the bits are read
    virtual uint64_t to_logical(uint64_t raw) const = 0;

    virtual std::string name() const = 0;
};

} // namespace codec

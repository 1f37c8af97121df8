// src/codec/type_registry.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "codec/codec_engine.hpp"
#include "codec/codec_error.hpp"
#include "codec/record_schema.hpp"
#include "utils/bitpack.hpp"

namespace codec {

/**
 * TypeRegistry - name-keyed codec lookup for callers that only know a
 * record's type name and pick the bit order at run time.
 *
 * Objects pass through as untyped pointers; serialize() expects obj to
 * point at an instance of the registered type.
 */
class TypeRegistry {
public:
    TypeRegistry() = default;

    static TypeRegistry& instance();

    // Registers T under its schema name. Re-registering the same type is a
    // no-op; a different type under a taken name throws.
    template <typename T>
    void register_type() {
        Entry e;
        e.type = std::type_index(typeid(T));
        e.layout = layout_of<T>();
        e.make = [] { return std::static_pointer_cast<void>(std::make_shared<T>()); };
        add(std::move(e));
    }

    bool contains(const std::string& type_name) const;
    LayoutPtr layout(const std::string& type_name) const;
    std::vector<std::string> type_names() const;
    size_t size() const;
    void clear();

    std::vector<uint8_t> serialize(const std::string& type_name, const void* obj,
                                   utils::BitOrder order,
                                   const CodecOptions& options = CodecOptions()) const;

    // Fails with BufferTooSmall before touching out; returns bits written
    size_t serialize(const std::string& type_name, const void* obj,
                     uint8_t* out, size_t out_len, utils::BitOrder order,
                     const CodecOptions& options = CodecOptions()) const;

    std::shared_ptr<void> deserialize(const std::string& type_name,
                                      const uint8_t* data, size_t data_len,
                                      utils::BitOrder order,
                                      const CodecOptions& options = CodecOptions()) const;

    template <typename T>
    std::shared_ptr<T> deserialize_as(const std::string& type_name,
                                      const uint8_t* data, size_t data_len,
                                      utils::BitOrder order,
                                      const CodecOptions& options = CodecOptions()) const {
        const Entry e = find(type_name);
        if (e.type != std::type_index(typeid(T))) {
            throw CodecError(ErrorKind::UnregisteredType,
                             "'" + type_name + "' is registered for a different type than requested");
        }
        return std::static_pointer_cast<T>(decode(e, data, data_len, order, options));
    }

private:
    struct Entry {
        std::type_index type = std::type_index(typeid(void));
        LayoutPtr layout;
        std::function<std::shared_ptr<void>()> make;
    };

    void add(Entry e);
    Entry find(const std::string& type_name) const;

    static std::shared_ptr<void> decode(const Entry& e, const uint8_t* data, size_t data_len,
                                        utils::BitOrder order, const CodecOptions& options);

    mutable std::mutex mu_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace codec

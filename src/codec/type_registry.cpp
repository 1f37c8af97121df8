// src/codec/type_registry.cpp
#include "codec/type_registry.hpp"
#include "utils/logging.hpp"

#include <algorithm>

namespace codec {

namespace {

size_t write(utils::BitOrder order, const TypeLayout& layout, const void* obj,
             uint8_t* out, size_t out_len, const CodecOptions& options) {
    if (order == utils::BitOrder::Msb) {
        return CodecEngine<utils::BitOrder::Msb>::serialize(layout, obj, out, out_len, 0, options);
    }
    return CodecEngine<utils::BitOrder::Lsb>::serialize(layout, obj, out, out_len, 0, options);
}

} // namespace

TypeRegistry& TypeRegistry::instance() {
    static TypeRegistry registry;
    return registry;
}

void TypeRegistry::add(Entry e) {
    const std::string name = e.layout->type_name;

    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(name);
    if (it != entries_.end()) {
        if (it->second.type == e.type) {
            return;
        }
        throw CodecError(ErrorKind::UnregisteredType,
                         "type name '" + name + "' is already registered for another type");
    }
    entries_.emplace(name, std::move(e));
    LOG_INFO("[TypeRegistry] Registered %s", name.c_str());
}

TypeRegistry::Entry TypeRegistry::find(const std::string& type_name) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(type_name);
    if (it == entries_.end()) {
        throw CodecError(ErrorKind::UnregisteredType, "no type registered as '" + type_name + "'");
    }
    return it->second;
}

bool TypeRegistry::contains(const std::string& type_name) const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.count(type_name) != 0;
}

LayoutPtr TypeRegistry::layout(const std::string& type_name) const {
    return find(type_name).layout;
}

std::vector<std::string> TypeRegistry::type_names() const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mu_);
        names.reserve(entries_.size());
        for (const auto& kv : entries_) {
            names.push_back(kv.first);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

size_t TypeRegistry::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
}

void TypeRegistry::clear() {
    std::lock_guard<std::mutex> lock(mu_);
    entries_.clear();
    LOG_INFO("[TypeRegistry] Cleared");
}

std::vector<uint8_t> TypeRegistry::serialize(const std::string& type_name, const void* obj,
                                             utils::BitOrder order,
                                             const CodecOptions& options) const {
    const Entry e = find(type_name);
    const size_t bits = measure_bits(*e.layout, obj, options);

    std::vector<uint8_t> out((bits + 7) / 8, 0);
    write(order, *e.layout, obj, out.data(), out.size(), options);
    return out;
}

size_t TypeRegistry::serialize(const std::string& type_name, const void* obj,
                               uint8_t* out, size_t out_len, utils::BitOrder order,
                               const CodecOptions& options) const {
    const Entry e = find(type_name);
    const size_t needed = (measure_bits(*e.layout, obj, options) + 7) / 8;
    if (out_len < needed) {
        throw CodecError(ErrorKind::BufferTooSmall,
                         type_name + " needs " + std::to_string(needed) +
                         " bytes, buffer holds " + std::to_string(out_len));
    }
    return write(order, *e.layout, obj, out, out_len, options);
}

std::shared_ptr<void> TypeRegistry::deserialize(const std::string& type_name,
                                                const uint8_t* data, size_t data_len,
                                                utils::BitOrder order,
                                                const CodecOptions& options) const {
    return decode(find(type_name), data, data_len, order, options);
}

std::shared_ptr<void> TypeRegistry::decode(const Entry& e, const uint8_t* data, size_t data_len,
                                           utils::BitOrder order, const CodecOptions& options) {
    std::shared_ptr<void> obj = e.make();
    if (order == utils::BitOrder::Msb) {
        CodecEngine<utils::BitOrder::Msb>::deserialize(*e.layout, obj.get(), data, data_len, 0, options);
    } else {
        CodecEngine<utils::BitOrder::Lsb>::deserialize(*e.layout, obj.get(), data, data_len, 0, options);
    }
    return obj;
}

} // namespace codec

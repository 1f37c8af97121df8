// src/codec/layout_cache.hpp
#pragma once

#include <functional>
#include <mutex>
#include <typeindex>
#include <unordered_map>

#include "codec/type_layout.hpp"

namespace codec {

/**
 * LayoutCache - process-wide memo of built layouts, keyed by type.
 *
 * A layout is built at most once per type in the common case. Builds run
 * outside the lock; when two threads race on first use the first insert
 * wins and both callers get that layout. A type whose build re-enters
 * itself (directly or through nested types) raises RecursiveLayout.
 */
class LayoutCache {
public:
    using Builder = std::function<LayoutPtr()>;

    static LayoutCache& instance();

    LayoutPtr get_or_build(std::type_index type, const char* type_name, const Builder& build);

    // Cached layout or nullptr
    LayoutPtr find(std::type_index type) const;

    size_t size() const;
    void clear();

private:
    LayoutCache() = default;

    mutable std::mutex mu_;
    std::unordered_map<std::type_index, LayoutPtr> layouts_;
};

} // namespace codec

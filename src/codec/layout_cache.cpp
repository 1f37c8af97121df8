// src/codec/layout_cache.cpp
#include "codec/layout_cache.hpp"
#include "codec/codec_error.hpp"
#include "utils/logging.hpp"

#include <unordered_set>

namespace codec {

namespace {

// Types whose layout is being built on this thread
std::unordered_set<std::type_index>& in_progress() {
    thread_local std::unordered_set<std::type_index> types;
    return types;
}

// Marks a type as being built for the lifetime of the guard
class BuildGuard {
public:
    explicit BuildGuard(std::type_index type) : type_(type) { in_progress().insert(type_); }
    ~BuildGuard() { in_progress().erase(type_); }

    BuildGuard(const BuildGuard&) = delete;
    BuildGuard& operator=(const BuildGuard&) = delete;

private:
    std::type_index type_;
};

} // namespace

LayoutCache& LayoutCache::instance() {
    static LayoutCache cache;
    return cache;
}

LayoutPtr LayoutCache::get_or_build(std::type_index type, const char* type_name, const Builder& build) {
    if (LayoutPtr cached = find(type)) {
        return cached;
    }

    if (in_progress().count(type)) {
        throw LayoutError(ErrorKind::RecursiveLayout, type_name,
                          "layout refers to itself through its fields");
    }

    LayoutPtr built;
    {
        BuildGuard guard(type);
        built = build();
    }

    std::lock_guard<std::mutex> lock(mu_);
    auto inserted = layouts_.emplace(type, built);
    if (inserted.second) {
        LOG_DEBUG("[LayoutCache] cached %s (%zu types)", built->type_name.c_str(), layouts_.size());
    }
    return inserted.first->second;
}

LayoutPtr LayoutCache::find(std::type_index type) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = layouts_.find(type);
    return it == layouts_.end() ? nullptr : it->second;
}

size_t LayoutCache::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return layouts_.size();
}

void LayoutCache::clear() {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mu_);
        dropped = layouts_.size();
        layouts_.clear();
    }
    LOG_INFO("[LayoutCache] Cleared %zu layouts", dropped);
}

} // namespace codec

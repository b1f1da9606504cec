/**
 * @file type_cache.cpp
 * @brief Deduplication of repeated object shapes
 */

#include "jsonts/type_cache.hpp"

#include <format>

namespace jsonts::cache {

TypeCache TypeCache::squash(const types::TypeTree& tree,
                            const registry::SignatureRegistry& registry,
                            const SquashOptions& options)
{
    TypeCache cache;
    if (!options.enabled) {
        return cache;
    }

    for (const auto& entry : registry.entries()) {
        if (entry.count < 2 || entry.nodes.empty()) {
            continue;
        }
        const types::NodeId representative = entry.nodes.front();
        if (!tree.node(representative).is_object()) {
            continue;
        }
        cache.m_index.emplace(entry.fingerprint, cache.m_entries.size());
        cache.m_entries.push_back(
            TypeCacheEntry{.fingerprint = entry.fingerprint,
                           .name = generated_name(options.root_name, cache.m_entries.size()),
                           .representative = representative,
                           .body = std::nullopt,
                           .usage_count = 0});
    }
    return cache;
}

std::string TypeCache::generated_name(std::string_view root_name, std::size_t index)
{
    return std::format("{}_{}", root_name, index);
}

TypeCacheEntry* TypeCache::find(const std::string& fingerprint)
{
    const auto found = m_index.find(fingerprint);
    return found == m_index.end() ? nullptr : &m_entries[found->second];
}

const TypeCacheEntry* TypeCache::find(const std::string& fingerprint) const
{
    const auto found = m_index.find(fingerprint);
    return found == m_index.end() ? nullptr : &m_entries[found->second];
}

}  // namespace jsonts::cache

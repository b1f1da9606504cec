#pragma once

/**
 * @file type_cache.hpp
 * @brief Shared declarations minted for repeated object shapes (squashing)
 */

#include "jsonts/declaration.hpp"
#include "jsonts/signature_registry.hpp"
#include "jsonts/type_tree.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jsonts::cache {

struct TypeCacheEntry
{
    std::string fingerprint;
    std::string name;
    /// First node registered under the fingerprint; the body is rendered from it
    types::NodeId representative = types::kInvalidNode;
    /// Filled by the emitter the first time the entry is referenced
    std::optional<declare::TypeExpr> body;
    std::uint32_t usage_count = 0;
};

struct SquashOptions
{
    bool enabled = true;
    std::string root_name;
};

class TypeCache
{
public:
    TypeCache() = default;

    /**
     * Mint one entry per eligible fingerprint whose registry count is at
     * least 2, named `<root_name>_<index>` in order of first appearance.
     * Only object shapes are eligible. A disabled squash yields an empty cache.
     */
    [[nodiscard]] static TypeCache squash(const types::TypeTree& tree,
                                          const registry::SignatureRegistry& registry,
                                          const SquashOptions& options);

    [[nodiscard]] static std::string generated_name(std::string_view root_name, std::size_t index);

    [[nodiscard]] TypeCacheEntry* find(const std::string& fingerprint);
    [[nodiscard]] const TypeCacheEntry* find(const std::string& fingerprint) const;

    [[nodiscard]] const std::vector<TypeCacheEntry>& entries() const noexcept { return m_entries; }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }

private:
    std::vector<TypeCacheEntry> m_entries;
    std::unordered_map<std::string, std::size_t> m_index;
};

}  // namespace jsonts::cache

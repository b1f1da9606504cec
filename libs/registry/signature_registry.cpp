/**
 * @file signature_registry.cpp
 * @brief Signature registry construction
 */

#include "jsonts/signature_registry.hpp"

#include <format>

namespace jsonts::registry {

jsonts::Result<SignatureRegistry> SignatureRegistry::build(const types::TypeTree& tree)
{
    SignatureRegistry registry;
    for (const types::NodeId id : tree.pre_order()) {
        if (id == tree.root()) {
            continue;
        }
        const types::TypeNode& node = tree.node(id);
        if (node.kind == types::NodeKind::kUnknown) {
            continue;
        }
        if (!node.fingerprint) {
            return std::unexpected(Error::make(
                "FingerprintMissing",
                std::format("Node {} ('{}') has no fingerprint; run the hashing pass first", id, node.name)));
        }

        auto [slot, inserted] = registry.m_index.try_emplace(*node.fingerprint, registry.m_entries.size());
        if (inserted) {
            registry.m_entries.push_back(SignatureEntry{.fingerprint = *node.fingerprint});
        }
        SignatureEntry& entry = registry.m_entries[slot->second];
        entry.nodes.push_back(id);
        entry.count += node.occurrences;
    }
    return registry;
}

const SignatureEntry* SignatureRegistry::find(const std::string& fingerprint) const
{
    const auto found = m_index.find(fingerprint);
    if (found == m_index.end()) {
        return nullptr;
    }
    return &m_entries[found->second];
}

std::uint64_t SignatureRegistry::count(const std::string& fingerprint) const
{
    const SignatureEntry* entry = find(fingerprint);
    return entry == nullptr ? 0 : entry->count;
}

}  // namespace jsonts::registry

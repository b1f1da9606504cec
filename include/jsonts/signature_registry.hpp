#pragma once

/**
 * @file signature_registry.hpp
 * @brief Fingerprint -> nodes index over one type tree
 */

#include "jsonts/common.hpp"
#include "jsonts/type_tree.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace jsonts::registry {

struct SignatureEntry
{
    std::string fingerprint;
    /// Nodes sharing the fingerprint, in first-seen (document) order
    std::vector<types::NodeId> nodes;
    /// Source occurrences represented by those nodes
    std::uint64_t count = 0;
};

/**
 * @brief Immutable index of every non-root fingerprint in a tree
 *
 * Built in one pre-order pass; entries keep the order in which their
 * fingerprint first appeared so generated names are stable across runs.
 * The root and empty-array placeholders are never registered.
 */
class SignatureRegistry
{
public:
    /// @pre compute_fingerprints() succeeded on `tree`
    [[nodiscard]] static jsonts::Result<SignatureRegistry> build(const types::TypeTree& tree);

    [[nodiscard]] const SignatureEntry* find(const std::string& fingerprint) const;
    [[nodiscard]] std::uint64_t count(const std::string& fingerprint) const;

    [[nodiscard]] const std::vector<SignatureEntry>& entries() const noexcept { return m_entries; }
    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }

private:
    SignatureRegistry() = default;

    std::vector<SignatureEntry> m_entries;
    std::unordered_map<std::string, std::size_t> m_index;
};

}  // namespace jsonts::registry

/**
 * @file engine.cpp
 * @brief Pipeline driver for type inference and squashing
 */

#include "jsonts/engine.hpp"

#include "jsonts/emitter.hpp"
#include "jsonts/fingerprint.hpp"
#include "jsonts/render.hpp"
#include "jsonts/signature_registry.hpp"
#include "jsonts/type_cache.hpp"

#include <algorithm>
#include <format>

namespace jsonts {

jsonts::Result<InferenceResult> infer_declarations(const JsonValue& document, const EngineConfig& config)
{
    if (!render::is_identifier(config.root_name)) {
        return std::unexpected(Error::make(
            "InvalidArgument", std::format("Root name is not a valid identifier: '{}'", config.root_name)));
    }

    types::TypeTree tree = types::build_type_tree(document);
    if (auto hashed = fingerprint::compute_fingerprints(tree); !hashed) {
        return std::unexpected(hashed.error());
    }

    auto signatures = registry::SignatureRegistry::build(tree);
    if (!signatures) {
        return std::unexpected(signatures.error());
    }

    cache::TypeCache type_cache = cache::TypeCache::squash(
        tree, *signatures, cache::SquashOptions{.enabled = config.squash, .root_name = config.root_name});

    InferenceResult result{.declarations = declare::emit_declarations(tree, type_cache, config.root_name),
                           .stats = EngineStats{}};
    result.declarations.squash = config.squash;

    result.stats.node_count = tree.pre_order().size();
    result.stats.distinct_fingerprints = signatures->size();
    result.stats.repeated_fingerprints = static_cast<std::size_t>(std::ranges::count_if(
        signatures->entries(), [](const registry::SignatureEntry& entry) { return entry.count >= 2; }));
    result.stats.shared_declarations = static_cast<std::size_t>(std::ranges::count_if(
        result.declarations.declarations, &declare::Declaration::shared));
    return result;
}

}  // namespace jsonts

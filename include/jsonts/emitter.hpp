#pragma once

/**
 * @file emitter.hpp
 * @brief Declaration emission over a fingerprinted, squashed type tree
 */

#include "jsonts/declaration.hpp"
#include "jsonts/type_cache.hpp"
#include "jsonts/type_tree.hpp"

#include <string>

namespace jsonts::declare {

/**
 * Walk the tree from the root and produce the declaration sequence.
 *
 * A non-root node whose fingerprint has a cache entry becomes a reference to
 * that entry and is not descended into. An entry's declaration is rendered
 * once, from its representative, the first time it is referenced, and is
 * appended before the declaration that referenced it. The root declaration,
 * named `root_name`, comes last. Usage counters in `cache` are updated.
 */
[[nodiscard]] DeclarationSet emit_declarations(const types::TypeTree& tree,
                                               cache::TypeCache& cache,
                                               const std::string& root_name);

}  // namespace jsonts::declare

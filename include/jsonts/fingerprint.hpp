#pragma once

/**
 * @file fingerprint.hpp
 * @brief Structural fingerprints for type tree nodes
 *
 * A fingerprint is "sha256:" + hex digest of the canonical JSON shape record
 * of a node. The record holds the node's kind and its children's fingerprints
 * (object fields sorted by name, with their optional flag) and never the
 * node's own name, so equal shapes under different field names collide on
 * purpose. Distinct shapes colliding is accepted as negligible at 256 bits.
 */

#include "jsonts/common.hpp"
#include "jsonts/type_tree.hpp"

#include <nlohmann/json.hpp>

namespace jsonts::fingerprint {

/**
 * Shape record hashed for one node.
 * @pre Every child of `id` already carries a fingerprint.
 */
[[nodiscard]] jsonts::Result<nlohmann::json> shape_record(const types::TypeTree& tree,
                                                          types::NodeId id);

/**
 * Fingerprint every node reachable from the root in one post-order pass.
 * The root is fingerprinted last.
 */
[[nodiscard]] jsonts::VoidResult compute_fingerprints(types::TypeTree& tree);

}  // namespace jsonts::fingerprint

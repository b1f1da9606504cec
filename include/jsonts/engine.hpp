#pragma once

/**
 * @file engine.hpp
 * @brief Type inference and squashing for one JSON document
 *
 * Stages run in order and never feed back:
 *   build type tree -> fingerprint -> signature registry -> type cache -> emit
 * All intermediate state is local to one call.
 */

#include "jsonts/common.hpp"
#include "jsonts/declaration.hpp"
#include "jsonts/type_tree.hpp"
#include "jsonts/version.hpp"

#include <cstddef>
#include <string>

namespace jsonts {

struct EngineConfig
{
    /// Factor repeated object shapes into shared declarations
    bool squash = true;
    /// Root declaration name; shared declarations are named `<root_name>_<n>`
    std::string root_name = kDefaultRootName;
};

struct EngineStats
{
    std::size_t node_count = 0;             ///< Nodes reachable from the root
    std::size_t distinct_fingerprints = 0;  ///< Registry entries
    std::size_t repeated_fingerprints = 0;  ///< Registry entries with count >= 2
    std::size_t shared_declarations = 0;    ///< Declarations minted by squashing
};

struct InferenceResult
{
    declare::DeclarationSet declarations;
    EngineStats stats;
};

/**
 * Infer the declarations describing `document`.
 * @return Declarations in dependency order, or InvalidArgument when
 *         `config.root_name` is not an identifier
 */
[[nodiscard]] jsonts::Result<InferenceResult> infer_declarations(const JsonValue& document,
                                                                 const EngineConfig& config = {});

}  // namespace jsonts

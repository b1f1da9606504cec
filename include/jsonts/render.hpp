#pragma once

/**
 * @file render.hpp
 * @brief Output syntaxes for emitted declarations
 *
 * - TypeScript `type` aliases (the default output)
 * - JSON manifest (schema "declarations.v1"), serialized canonically
 */

#include "jsonts/declaration.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace jsonts::render {

/// True when `name` can be written as a bare TypeScript property name.
[[nodiscard]] bool is_identifier(std::string_view name) noexcept;

/// Property name, quoted as a string literal when it is not an identifier.
[[nodiscard]] std::string property_name(std::string_view name);

/**
 * Render a type expression. Object members are indented two spaces per
 * level below `depth`; the closing brace sits at `depth`.
 */
[[nodiscard]] std::string render_type_expr(const declare::TypeExpr& expr, std::size_t depth = 0);

/**
 * Render all declarations as `type <Name> = <expr>;` blocks separated by a
 * blank line, in declaration order.
 */
[[nodiscard]] std::string render_typescript(const declare::DeclarationSet& declarations);

[[nodiscard]] nlohmann::json type_expr_to_json(const declare::TypeExpr& expr);

/// Manifest document validated by schemas/declarations.v1.schema.json
[[nodiscard]] nlohmann::json to_manifest(const declare::DeclarationSet& declarations);

}  // namespace jsonts::render

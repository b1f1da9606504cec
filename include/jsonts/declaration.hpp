#pragma once

/**
 * @file declaration.hpp
 * @brief Emitted type declarations, independent of the output syntax
 */

#include <cstdint>
#include <string>
#include <vector>

namespace jsonts::declare {

enum class ExprKind : std::uint8_t {
    kPrimitive,  ///< `name` holds the keyword (string, number, boolean, null)
    kAny,        ///< Unconstrained (element of an empty array)
    kReference,  ///< `name` holds a declaration name
    kArray,      ///< `items[0]` is the element type
    kUnion,      ///< `items` are the members
    kObject,     ///< `fields` sorted by name
};

struct FieldExpr;

/**
 * @brief Structural type expression forming a declaration body
 */
struct TypeExpr
{
    ExprKind kind = ExprKind::kAny;
    std::string name;
    std::vector<TypeExpr> items;
    std::vector<FieldExpr> fields;
};

struct FieldExpr
{
    std::string name;
    bool optional = false;
    TypeExpr type;
};

struct Declaration
{
    std::string name;
    TypeExpr body;
    std::string fingerprint;
    /// Use sites referring to this declaration (0 for the root)
    std::uint32_t references = 0;
    /// Minted by squashing rather than the root declaration
    bool shared = false;
};

/**
 * @brief Declarations in dependency order; the root declaration is last
 */
struct DeclarationSet
{
    std::vector<Declaration> declarations;
    std::string root_name;
    bool squash = true;

    [[nodiscard]] const Declaration* find(const std::string& name) const
    {
        for (const auto& declaration : declarations) {
            if (declaration.name == name) {
                return &declaration;
            }
        }
        return nullptr;
    }

    [[nodiscard]] const Declaration& root() const { return declarations.back(); }
};

}  // namespace jsonts::declare

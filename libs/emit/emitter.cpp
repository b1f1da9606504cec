/**
 * @file emitter.cpp
 * @brief Declaration emission
 */

#include "jsonts/emitter.hpp"

#include <utility>
#include <vector>

namespace jsonts::declare {

namespace {

class DeclarationEmitter
{
public:
    DeclarationEmitter(const types::TypeTree& tree, cache::TypeCache& cache)
        : m_tree(tree)
        , m_cache(cache)
    {}

    /// Expression printed at a use site: a cache reference when one exists.
    [[nodiscard]] TypeExpr expression_for(types::NodeId id)
    {
        const types::TypeNode& node = m_tree.node(id);
        if (id != m_tree.root() && node.fingerprint) {
            if (cache::TypeCacheEntry* entry = m_cache.find(*node.fingerprint)) {
                return reference_to(*entry);
            }
        }
        return inline_structure(id);
    }

    [[nodiscard]] TypeExpr inline_structure(types::NodeId id)
    {
        const types::TypeNode& node = m_tree.node(id);
        switch (node.kind) {
            case types::NodeKind::kPrimitive:
                return primitive(node.primitives.kinds().front());
            case types::NodeKind::kUnknown:
                return TypeExpr{.kind = ExprKind::kAny};
            case types::NodeKind::kArray: {
                TypeExpr array{.kind = ExprKind::kArray};
                array.items.push_back(expression_for(node.children.front()));
                return array;
            }
            case types::NodeKind::kObject: {
                TypeExpr object{.kind = ExprKind::kObject};
                object.fields.reserve(node.children.size());
                for (const types::NodeId child : node.children) {
                    const types::TypeNode& field = m_tree.node(child);
                    object.fields.push_back(FieldExpr{.name = field.name,
                                                      .optional = field.optional,
                                                      .type = expression_for(child)});
                }
                return object;
            }
            case types::NodeKind::kUnion: {
                TypeExpr alternatives{.kind = ExprKind::kUnion};
                for (const auto kind : node.primitives.kinds()) {
                    alternatives.items.push_back(primitive(kind));
                }
                for (const types::NodeId member : node.children) {
                    alternatives.items.push_back(expression_for(member));
                }
                if (alternatives.items.size() == 1) {
                    return std::move(alternatives.items.front());
                }
                return alternatives;
            }
        }
        return TypeExpr{.kind = ExprKind::kAny};
    }

    [[nodiscard]] std::vector<Declaration> take_shared()
    {
        for (auto& declaration : m_shared) {
            if (const cache::TypeCacheEntry* entry = m_cache.find(declaration.fingerprint)) {
                declaration.references = entry->usage_count;
            }
        }
        return std::move(m_shared);
    }

private:
    [[nodiscard]] static TypeExpr primitive(types::PrimitiveKind kind)
    {
        return TypeExpr{.kind = ExprKind::kPrimitive, .name = std::string(types::to_string(kind))};
    }

    [[nodiscard]] TypeExpr reference_to(cache::TypeCacheEntry& entry)
    {
        ++entry.usage_count;
        if (!entry.body) {
            // Mark as in progress before descending.
            entry.body.emplace();
            TypeExpr body = inline_structure(entry.representative);
            entry.body = body;
            m_shared.push_back(Declaration{.name = entry.name,
                                           .body = std::move(body),
                                           .fingerprint = entry.fingerprint,
                                           .references = 0,
                                           .shared = true});
        }
        return TypeExpr{.kind = ExprKind::kReference, .name = entry.name};
    }

    const types::TypeTree& m_tree;
    cache::TypeCache& m_cache;
    std::vector<Declaration> m_shared;
};

}  // namespace

DeclarationSet emit_declarations(const types::TypeTree& tree,
                                 cache::TypeCache& cache,
                                 const std::string& root_name)
{
    DeclarationEmitter emitter(tree, cache);
    TypeExpr root_body = emitter.inline_structure(tree.root());

    DeclarationSet result{.declarations = emitter.take_shared(), .root_name = root_name};
    result.declarations.push_back(
        Declaration{.name = root_name,
                    .body = std::move(root_body),
                    .fingerprint = tree.node(tree.root()).fingerprint.value_or(std::string{}),
                    .references = 0,
                    .shared = false});
    return result;
}

}  // namespace jsonts::declare

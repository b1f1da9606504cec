#pragma once

/**
 * @file type_tree.hpp
 * @brief Typed tree inferred from a JSON document
 *
 * Nodes live in an arena (TypeTree) and refer to each other by NodeId.
 * A parent owns its children's ids; there are no back-references.
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace jsonts {

/// Input documents keep their object keys in source order while merging.
using JsonValue = nlohmann::ordered_json;

}  // namespace jsonts

namespace jsonts::types {

using NodeId = std::uint32_t;

inline constexpr NodeId kInvalidNode = std::numeric_limits<NodeId>::max();

/// Name of the root node.
inline constexpr std::string_view kRootName = "$";
/// Role name of an array's representative element.
inline constexpr std::string_view kElementName = "[]";
/// Role name of an object or array member of a union.
inline constexpr std::string_view kMemberName = "|";

enum class NodeKind : std::uint8_t {
    kObject,
    kArray,
    kPrimitive,
    kUnion,    ///< Widened kinds: primitive set plus at most one object and one array member
    kUnknown,  ///< Element of an empty array
};

enum class PrimitiveKind : std::uint8_t {
    kString,
    kNumber,
    kBoolean,
    kNull,
};

[[nodiscard]] std::string_view to_string(NodeKind kind) noexcept;
[[nodiscard]] std::string_view to_string(PrimitiveKind kind) noexcept;

/**
 * @brief Set of primitive kinds, always iterated in PrimitiveKind order
 */
class PrimitiveSet
{
public:
    PrimitiveSet() = default;
    explicit PrimitiveSet(PrimitiveKind kind) noexcept { insert(kind); }

    void insert(PrimitiveKind kind) noexcept;
    void merge(PrimitiveSet other) noexcept { m_bits |= other.m_bits; }

    [[nodiscard]] bool contains(PrimitiveKind kind) const noexcept;
    [[nodiscard]] bool empty() const noexcept { return m_bits == 0; }
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::vector<PrimitiveKind> kinds() const;

    friend bool operator==(PrimitiveSet, PrimitiveSet) = default;

private:
    std::uint8_t m_bits = 0;
};

struct TypeNode
{
    NodeKind kind = NodeKind::kUnknown;
    /// Field name, or the role name for roots, elements and union members
    std::string name;
    /// kPrimitive: exactly one kind. kUnion: the primitive members.
    PrimitiveSet primitives;
    /// kObject: fields sorted by name. kArray: one element.
    /// kUnion: object member before array member.
    std::vector<NodeId> children;
    /// Set by the hashing pass
    std::optional<std::string> fingerprint;
    /// Field was absent from at least one merged occurrence of its parent
    bool optional = false;
    /// Number of source values this node stands for
    std::uint32_t occurrences = 1;

    [[nodiscard]] bool is_object() const noexcept { return kind == NodeKind::kObject; }
};

class TypeTree
{
public:
    TypeTree() = default;

    [[nodiscard]] NodeId add(TypeNode node);

    [[nodiscard]] TypeNode& node(NodeId id) { return m_nodes.at(id); }
    [[nodiscard]] const TypeNode& node(NodeId id) const { return m_nodes.at(id); }

    [[nodiscard]] NodeId root() const noexcept { return m_root; }
    void set_root(NodeId id) noexcept { m_root = id; }

    /// Arena size, including nodes discarded by array merging
    [[nodiscard]] std::size_t arena_size() const noexcept { return m_nodes.size(); }

    /// Nodes reachable from the root, parents before children, fields in order
    [[nodiscard]] std::vector<NodeId> pre_order() const;
    /// Nodes reachable from the root, children before parents
    [[nodiscard]] std::vector<NodeId> post_order() const;

private:
    std::vector<TypeNode> m_nodes;
    NodeId m_root = kInvalidNode;
};

/**
 * Build the typed tree for a JSON document.
 *
 * Array elements are built one by one and merged into a single representative
 * element: object fields are unioned (missing fields become optional) and
 * differing kinds widen to a union. Object fields of the finished tree are
 * sorted by name, so key order in the document never shows in the result.
 * Never fails.
 */
[[nodiscard]] TypeTree build_type_tree(const JsonValue& document);

/**
 * Merge `incoming` into `target` and return the id of the merged node.
 *
 * The result is `target` itself unless the kinds differ, in which case a new
 * union node is returned. Occurrence counts are summed.
 */
[[nodiscard]] NodeId merge_nodes(TypeTree& tree, NodeId target, NodeId incoming);

}  // namespace jsonts::types

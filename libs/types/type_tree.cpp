/**
 * @file type_tree.cpp
 * @brief Type tree construction and array element merging
 */

#include "jsonts/type_tree.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <ranges>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace jsonts::types {

namespace {

constexpr std::array kPrimitiveOrder = {PrimitiveKind::kString,
                                        PrimitiveKind::kNumber,
                                        PrimitiveKind::kBoolean,
                                        PrimitiveKind::kNull};

[[nodiscard]] constexpr std::uint8_t bit_for(PrimitiveKind kind) noexcept
{
    return static_cast<std::uint8_t>(1U << std::to_underlying(kind));
}

[[nodiscard]] TypeNode make_node(NodeKind kind, std::string_view name)
{
    TypeNode node;
    node.kind = kind;
    node.name = std::string(name);
    return node;
}

[[nodiscard]] TypeNode make_primitive(PrimitiveKind primitive, std::string_view name)
{
    TypeNode node = make_node(NodeKind::kPrimitive, name);
    node.primitives.insert(primitive);
    return node;
}

[[nodiscard]] NodeId build_node(TypeTree& tree, const JsonValue& value, std::string_view name);

[[nodiscard]] NodeId build_object(TypeTree& tree, const JsonValue& value, std::string_view name)
{
    TypeNode object = make_node(NodeKind::kObject, name);
    object.children.reserve(value.size());
    for (const auto& [key, item] : value.items()) {
        object.children.push_back(build_node(tree, item, key));
    }
    return tree.add(std::move(object));
}

[[nodiscard]] NodeId build_array(TypeTree& tree, const JsonValue& value, std::string_view name)
{
    NodeId element = kInvalidNode;
    for (const auto& item : value) {
        const NodeId built = build_node(tree, item, kElementName);
        element = element == kInvalidNode ? built : merge_nodes(tree, element, built);
    }
    if (element == kInvalidNode) {
        TypeNode placeholder = make_node(NodeKind::kUnknown, kElementName);
        placeholder.occurrences = 0;
        element = tree.add(std::move(placeholder));
    }

    TypeNode array = make_node(NodeKind::kArray, name);
    array.children.push_back(element);
    return tree.add(std::move(array));
}

NodeId build_node(TypeTree& tree, const JsonValue& value, std::string_view name)
{
    using ValueType = JsonValue::value_t;
    switch (value.type()) {
        case ValueType::object:
            return build_object(tree, value, name);
        case ValueType::array:
            return build_array(tree, value, name);
        case ValueType::string:
        case ValueType::binary:
            return tree.add(make_primitive(PrimitiveKind::kString, name));
        case ValueType::number_integer:
        case ValueType::number_unsigned:
        case ValueType::number_float:
            return tree.add(make_primitive(PrimitiveKind::kNumber, name));
        case ValueType::boolean:
            return tree.add(make_primitive(PrimitiveKind::kBoolean, name));
        case ValueType::null:
            return tree.add(make_primitive(PrimitiveKind::kNull, name));
        case ValueType::discarded:
            break;
    }
    return tree.add(make_node(NodeKind::kUnknown, name));
}

void merge_objects(TypeTree& tree, NodeId target, NodeId incoming)
{
    std::vector<NodeId> fields = tree.node(target).children;
    std::unordered_map<std::string, std::size_t> position;
    for (auto [i, field] : std::views::enumerate(fields)) {
        position.emplace(tree.node(field).name, static_cast<std::size_t>(i));
    }

    std::unordered_set<std::string> incoming_names;
    const std::vector<NodeId> incoming_fields = tree.node(incoming).children;
    for (const NodeId field : incoming_fields) {
        const std::string name = tree.node(field).name;
        incoming_names.insert(name);

        const auto found = position.find(name);
        if (found == position.end()) {
            tree.node(field).optional = true;
            position.emplace(name, fields.size());
            fields.push_back(field);
            continue;
        }

        const NodeId existing = fields[found->second];
        const bool optional = tree.node(existing).optional || tree.node(field).optional;
        const NodeId merged = merge_nodes(tree, existing, field);
        tree.node(merged).name = name;
        tree.node(merged).optional = optional;
        fields[found->second] = merged;
    }

    for (const NodeId field : fields) {
        if (!incoming_names.contains(tree.node(field).name)) {
            tree.node(field).optional = true;
        }
    }

    TypeNode& merged = tree.node(target);
    merged.children = std::move(fields);
    merged.occurrences += tree.node(incoming).occurrences;
}

void merge_arrays(TypeTree& tree, NodeId target, NodeId incoming)
{
    const NodeId element =
        merge_nodes(tree, tree.node(target).children.front(), tree.node(incoming).children.front());
    tree.node(element).name = std::string(kElementName);
    tree.node(element).optional = false;

    TypeNode& merged = tree.node(target);
    merged.children = {element};
    merged.occurrences += tree.node(incoming).occurrences;
}

/// Place an object or array member into a union, merging with a member of the same kind.
void attach_member(TypeTree& tree, NodeId union_id, NodeId member)
{
    const NodeKind kind = tree.node(member).kind;
    const std::vector<NodeId> members = tree.node(union_id).children;
    for (auto [i, existing] : std::views::enumerate(members)) {
        if (tree.node(existing).kind == kind) {
            const NodeId merged = merge_nodes(tree, existing, member);
            tree.node(union_id).children[static_cast<std::size_t>(i)] = merged;
            return;
        }
    }

    TypeNode& attached = tree.node(member);
    attached.name = std::string(kMemberName);
    attached.optional = false;
    auto& children = tree.node(union_id).children;
    if (kind == NodeKind::kObject) {
        children.insert(children.begin(), member);
    } else {
        children.push_back(member);
    }
}

void absorb_into_union(TypeTree& tree, NodeId union_id, NodeId member)
{
    const NodeKind kind = tree.node(member).kind;
    tree.node(union_id).occurrences += tree.node(member).occurrences;
    switch (kind) {
        case NodeKind::kUnknown:
            return;
        case NodeKind::kPrimitive:
            tree.node(union_id).primitives.merge(tree.node(member).primitives);
            return;
        case NodeKind::kUnion: {
            tree.node(union_id).primitives.merge(tree.node(member).primitives);
            const std::vector<NodeId> nested = tree.node(member).children;
            for (const NodeId child : nested) {
                attach_member(tree, union_id, child);
            }
            return;
        }
        case NodeKind::kObject:
        case NodeKind::kArray:
            attach_member(tree, union_id, member);
            return;
    }
}

[[nodiscard]] NodeId widen(TypeTree& tree, NodeId target, NodeId incoming)
{
    TypeNode widened = make_node(NodeKind::kUnion, tree.node(target).name);
    widened.optional = tree.node(target).optional;
    widened.occurrences = 0;
    const NodeId union_id = tree.add(std::move(widened));
    absorb_into_union(tree, union_id, target);
    absorb_into_union(tree, union_id, incoming);
    return union_id;
}

/// Put every reachable object's fields in name order.
void order_fields_by_name(TypeTree& tree)
{
    for (const NodeId id : tree.pre_order()) {
        if (!tree.node(id).is_object()) {
            continue;
        }
        std::ranges::sort(tree.node(id).children,
                          {},
                          [&tree](NodeId field) -> const std::string& { return tree.node(field).name; });
    }
}

}  // namespace

std::string_view to_string(NodeKind kind) noexcept
{
    switch (kind) {
        case NodeKind::kObject:
            return "object";
        case NodeKind::kArray:
            return "array";
        case NodeKind::kPrimitive:
            return "primitive";
        case NodeKind::kUnion:
            return "union";
        case NodeKind::kUnknown:
            return "unknown";
    }
    return "unknown";
}

std::string_view to_string(PrimitiveKind kind) noexcept
{
    switch (kind) {
        case PrimitiveKind::kString:
            return "string";
        case PrimitiveKind::kNumber:
            return "number";
        case PrimitiveKind::kBoolean:
            return "boolean";
        case PrimitiveKind::kNull:
            return "null";
    }
    return "null";
}

void PrimitiveSet::insert(PrimitiveKind kind) noexcept
{
    m_bits |= bit_for(kind);
}

bool PrimitiveSet::contains(PrimitiveKind kind) const noexcept
{
    return (m_bits & bit_for(kind)) != 0;
}

std::size_t PrimitiveSet::size() const noexcept
{
    return static_cast<std::size_t>(std::popcount(m_bits));
}

std::vector<PrimitiveKind> PrimitiveSet::kinds() const
{
    std::vector<PrimitiveKind> result;
    for (const auto kind : kPrimitiveOrder) {
        if (contains(kind)) {
            result.push_back(kind);
        }
    }
    return result;
}

NodeId TypeTree::add(TypeNode node)
{
    const auto id = static_cast<NodeId>(m_nodes.size());
    m_nodes.push_back(std::move(node));
    return id;
}

std::vector<NodeId> TypeTree::pre_order() const
{
    std::vector<NodeId> order;
    if (m_root == kInvalidNode) {
        return order;
    }
    std::vector<NodeId> pending{m_root};
    while (!pending.empty()) {
        const NodeId id = pending.back();
        pending.pop_back();
        order.push_back(id);
        const auto& children = node(id).children;
        pending.insert(pending.end(), children.rbegin(), children.rend());
    }
    return order;
}

std::vector<NodeId> TypeTree::post_order() const
{
    // Parent-first walk visiting the last child first, reversed.
    std::vector<NodeId> order;
    if (m_root == kInvalidNode) {
        return order;
    }
    std::vector<NodeId> pending{m_root};
    while (!pending.empty()) {
        const NodeId id = pending.back();
        pending.pop_back();
        order.push_back(id);
        const auto& children = node(id).children;
        pending.insert(pending.end(), children.begin(), children.end());
    }
    std::ranges::reverse(order);
    return order;
}

TypeTree build_type_tree(const JsonValue& document)
{
    TypeTree tree;
    tree.set_root(build_node(tree, document, kRootName));
    order_fields_by_name(tree);
    return tree;
}

NodeId merge_nodes(TypeTree& tree, NodeId target, NodeId incoming)
{
    const NodeKind target_kind = tree.node(target).kind;
    const NodeKind incoming_kind = tree.node(incoming).kind;

    if (incoming_kind == NodeKind::kUnknown) {
        tree.node(target).occurrences += tree.node(incoming).occurrences;
        return target;
    }
    if (target_kind == NodeKind::kUnknown) {
        TypeNode& adopted = tree.node(incoming);
        adopted.name = tree.node(target).name;
        adopted.optional = tree.node(target).optional;
        adopted.occurrences += tree.node(target).occurrences;
        return incoming;
    }
    if (target_kind == NodeKind::kUnion) {
        absorb_into_union(tree, target, incoming);
        return target;
    }
    if (target_kind == incoming_kind) {
        switch (target_kind) {
            case NodeKind::kPrimitive:
                if (tree.node(target).primitives == tree.node(incoming).primitives) {
                    tree.node(target).occurrences += tree.node(incoming).occurrences;
                    return target;
                }
                break;
            case NodeKind::kObject:
                merge_objects(tree, target, incoming);
                return target;
            case NodeKind::kArray:
                merge_arrays(tree, target, incoming);
                return target;
            case NodeKind::kUnion:
            case NodeKind::kUnknown:
                break;
        }
    }
    return widen(tree, target, incoming);
}

}  // namespace jsonts::types

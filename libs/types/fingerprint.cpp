/**
 * @file fingerprint.cpp
 * @brief Bottom-up structural hashing of the type tree
 */

#include "jsonts/fingerprint.hpp"

#include "jsonts/canonical_json.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <vector>

namespace jsonts::fingerprint {

namespace {

[[nodiscard]] jsonts::Result<std::string> child_fingerprint(const types::TypeTree& tree,
                                                            types::NodeId child)
{
    const auto& fingerprint = tree.node(child).fingerprint;
    if (!fingerprint) {
        return std::unexpected(Error::make(
            "FingerprintMissing", std::format("Child node {} has not been fingerprinted", child)));
    }
    return *fingerprint;
}

[[nodiscard]] nlohmann::json primitive_names(const types::PrimitiveSet& primitives)
{
    nlohmann::json names = nlohmann::json::array();
    for (const auto kind : primitives.kinds()) {
        names.push_back(std::string(types::to_string(kind)));
    }
    return names;
}

struct FieldEntry
{
    std::string name;
    std::string type;
    bool optional;
};

}  // namespace

jsonts::Result<nlohmann::json> shape_record(const types::TypeTree& tree, types::NodeId id)
{
    const types::TypeNode& node = tree.node(id);
    nlohmann::json record = {
        {"tag", std::string(types::to_string(node.kind))}
    };

    switch (node.kind) {
        case types::NodeKind::kPrimitive:
            record["primitives"] = primitive_names(node.primitives);
            break;
        case types::NodeKind::kArray: {
            auto element = child_fingerprint(tree, node.children.front());
            if (!element) {
                return std::unexpected(element.error());
            }
            record["element"] = *element;
            break;
        }
        case types::NodeKind::kObject: {
            std::vector<FieldEntry> fields;
            fields.reserve(node.children.size());
            for (const types::NodeId child : node.children) {
                auto type = child_fingerprint(tree, child);
                if (!type) {
                    return std::unexpected(type.error());
                }
                const types::TypeNode& field = tree.node(child);
                fields.push_back(
                    FieldEntry{.name = field.name, .type = std::move(*type), .optional = field.optional});
            }
            std::ranges::sort(fields, {}, &FieldEntry::name);

            nlohmann::json encoded = nlohmann::json::array();
            for (const auto& field : fields) {
                encoded.push_back({
                    {    "name",     field.name},
                    {    "type",     field.type},
                    {"optional", field.optional}
                });
            }
            record["fields"] = std::move(encoded);
            break;
        }
        case types::NodeKind::kUnion: {
            record["primitives"] = primitive_names(node.primitives);
            nlohmann::json members = nlohmann::json::array();
            for (const types::NodeId child : node.children) {
                auto member = child_fingerprint(tree, child);
                if (!member) {
                    return std::unexpected(member.error());
                }
                members.push_back(*member);
            }
            record["members"] = std::move(members);
            break;
        }
        case types::NodeKind::kUnknown:
            break;
    }
    return record;
}

jsonts::VoidResult compute_fingerprints(types::TypeTree& tree)
{
    for (const types::NodeId id : tree.post_order()) {
        auto record = shape_record(tree, id);
        if (!record) {
            return std::unexpected(record.error());
        }
        auto digest = canonical::hash_canonical(*record);
        if (!digest) {
            return std::unexpected(digest.error());
        }
        tree.node(id).fingerprint = std::move(*digest);
    }
    return {};
}

}  // namespace jsonts::fingerprint

/**
 * @file render.cpp
 * @brief TypeScript and JSON manifest rendering
 */

#include "jsonts/render.hpp"

#include "jsonts/version.hpp"

#include <algorithm>
#include <format>
#include <ranges>

namespace jsonts::render {

namespace {

constexpr std::string_view kIndentUnit = "  ";

[[nodiscard]] bool is_identifier_start(char ch) noexcept
{
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_' || ch == '$';
}

[[nodiscard]] bool is_identifier_part(char ch) noexcept
{
    return is_identifier_start(ch) || (ch >= '0' && ch <= '9');
}

[[nodiscard]] std::string indent(std::size_t depth)
{
    std::string text;
    text.reserve(depth * kIndentUnit.size());
    for (std::size_t i = 0; i < depth; ++i) {
        text += kIndentUnit;
    }
    return text;
}

[[nodiscard]] std::string_view kind_name(declare::ExprKind kind) noexcept
{
    switch (kind) {
        case declare::ExprKind::kPrimitive:
            return "primitive";
        case declare::ExprKind::kAny:
            return "any";
        case declare::ExprKind::kReference:
            return "reference";
        case declare::ExprKind::kArray:
            return "array";
        case declare::ExprKind::kUnion:
            return "union";
        case declare::ExprKind::kObject:
            return "object";
    }
    return "any";
}

}  // namespace

bool is_identifier(std::string_view name) noexcept
{
    if (name.empty() || !is_identifier_start(name.front())) {
        return false;
    }
    return std::ranges::all_of(name.substr(1), is_identifier_part);
}

std::string property_name(std::string_view name)
{
    if (is_identifier(name)) {
        return std::string(name);
    }
    return nlohmann::json(std::string(name)).dump();
}

std::string render_type_expr(const declare::TypeExpr& expr, std::size_t depth)
{
    switch (expr.kind) {
        case declare::ExprKind::kPrimitive:
        case declare::ExprKind::kReference:
            return expr.name;
        case declare::ExprKind::kAny:
            return "any";
        case declare::ExprKind::kArray: {
            const auto& element = expr.items.front();
            std::string text = render_type_expr(element, depth);
            if (element.kind == declare::ExprKind::kUnion) {
                text = std::format("({})", text);
            }
            return text + "[]";
        }
        case declare::ExprKind::kUnion: {
            std::string text;
            for (auto [i, member] : std::views::enumerate(expr.items)) {
                if (i != 0) {
                    text += " | ";
                }
                text += render_type_expr(member, depth);
            }
            return text;
        }
        case declare::ExprKind::kObject: {
            if (expr.fields.empty()) {
                return "{}";
            }
            std::string text = "{\n";
            for (const auto& field : expr.fields) {
                text += std::format("{}{}{}: {};\n",
                                    indent(depth + 1),
                                    property_name(field.name),
                                    field.optional ? "?" : "",
                                    render_type_expr(field.type, depth + 1));
            }
            text += indent(depth) + "}";
            return text;
        }
    }
    return "any";
}

std::string render_typescript(const declare::DeclarationSet& declarations)
{
    std::string text;
    for (auto [i, declaration] : std::views::enumerate(declarations.declarations)) {
        if (i != 0) {
            text += '\n';
        }
        text += std::format("type {} = {};\n", declaration.name, render_type_expr(declaration.body));
    }
    return text;
}

nlohmann::json type_expr_to_json(const declare::TypeExpr& expr)
{
    nlohmann::json j = {
        {"kind", std::string(kind_name(expr.kind))}
    };
    switch (expr.kind) {
        case declare::ExprKind::kPrimitive:
        case declare::ExprKind::kReference:
            j["name"] = expr.name;
            break;
        case declare::ExprKind::kAny:
            break;
        case declare::ExprKind::kArray:
            j["element"] = type_expr_to_json(expr.items.front());
            break;
        case declare::ExprKind::kUnion: {
            nlohmann::json members = nlohmann::json::array();
            for (const auto& member : expr.items) {
                members.push_back(type_expr_to_json(member));
            }
            j["members"] = std::move(members);
            break;
        }
        case declare::ExprKind::kObject: {
            nlohmann::json fields = nlohmann::json::array();
            for (const auto& field : expr.fields) {
                fields.push_back({
                    {    "name",                field.name},
                    {"optional",            field.optional},
                    {    "type", type_expr_to_json(field.type)}
                });
            }
            j["fields"] = std::move(fields);
            break;
        }
    }
    return j;
}

nlohmann::json to_manifest(const declare::DeclarationSet& declarations)
{
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& declaration : declarations.declarations) {
        entries.push_back({
            {       "name",                   declaration.name},
            {"fingerprint",            declaration.fingerprint},
            { "references",             declaration.references},
            {     "shared",                 declaration.shared},
            {       "type", type_expr_to_json(declaration.body)}
        });
    }
    return nlohmann::json{
        {"schema_version",                     kManifestSchemaVersion},
        {          "tool", {{"name", "jsonts"}, {"version", kVersion}}},
        {          "root",                     declarations.root_name},
        {        "squash",                        declarations.squash},
        {  "declarations",                                    entries}
    };
}

}  // namespace jsonts::render

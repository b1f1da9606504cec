/**
 * @file test_render.cpp
 * @brief TypeScript text and JSON manifest rendering
 */

#include "jsonts/declaration.hpp"
#include "jsonts/render.hpp"

#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace jsonts::render::test {

namespace {

using declare::Declaration;
using declare::DeclarationSet;
using declare::ExprKind;
using declare::FieldExpr;
using declare::TypeExpr;

[[nodiscard]] TypeExpr primitive(const std::string& name)
{
    return TypeExpr{.kind = ExprKind::kPrimitive, .name = name};
}

[[nodiscard]] TypeExpr reference(const std::string& name)
{
    return TypeExpr{.kind = ExprKind::kReference, .name = name};
}

[[nodiscard]] TypeExpr array_of(TypeExpr element)
{
    TypeExpr array{.kind = ExprKind::kArray};
    array.items.push_back(std::move(element));
    return array;
}

[[nodiscard]] TypeExpr object(std::vector<FieldExpr> fields)
{
    TypeExpr expr{.kind = ExprKind::kObject};
    expr.fields = std::move(fields);
    return expr;
}

}  // namespace

TEST(RenderTest, Identifiers)
{
    EXPECT_TRUE(is_identifier("amount"));
    EXPECT_TRUE(is_identifier("_private"));
    EXPECT_TRUE(is_identifier("$ref"));
    EXPECT_TRUE(is_identifier("v2"));
    EXPECT_FALSE(is_identifier(""));
    EXPECT_FALSE(is_identifier("2fa"));
    EXPECT_FALSE(is_identifier("first-name"));
    EXPECT_FALSE(is_identifier("with space"));
}

TEST(RenderTest, PropertyNamesQuotedWhenNeeded)
{
    EXPECT_EQ(property_name("amount"), "amount");
    EXPECT_EQ(property_name("first-name"), R"("first-name")");
    EXPECT_EQ(property_name(""), R"("")");
    EXPECT_EQ(property_name(R"(say "hi")"), R"("say \"hi\"")");
}

TEST(RenderTest, ScalarExpressions)
{
    EXPECT_EQ(render_type_expr(primitive("string")), "string");
    EXPECT_EQ(render_type_expr(reference("DefaultType_0")), "DefaultType_0");
    EXPECT_EQ(render_type_expr(TypeExpr{.kind = ExprKind::kAny}), "any");
    EXPECT_EQ(render_type_expr(array_of(TypeExpr{.kind = ExprKind::kAny})), "any[]");
    EXPECT_EQ(render_type_expr(array_of(array_of(primitive("number")))), "number[][]");
    EXPECT_EQ(render_type_expr(object({})), "{}");
}

TEST(RenderTest, UnionInsideArrayIsParenthesized)
{
    TypeExpr alternatives{.kind = ExprKind::kUnion};
    alternatives.items.push_back(primitive("string"));
    alternatives.items.push_back(primitive("null"));

    EXPECT_EQ(render_type_expr(alternatives), "string | null");
    EXPECT_EQ(render_type_expr(array_of(alternatives)), "(string | null)[]");
}

TEST(RenderTest, NestedObjectIndentation)
{
    const TypeExpr expr = object({
        FieldExpr{.name = "id", .optional = false, .type = primitive("number")},
        FieldExpr{.name = "meta",
                  .optional = true,
                  .type = object({FieldExpr{.name = "x-trace", .optional = false, .type = primitive("string")}})},
    });
    EXPECT_EQ(render_type_expr(expr),
              "{\n"
              "  id: number;\n"
              "  meta?: {\n"
              "    \"x-trace\": string;\n"
              "  };\n"
              "}");
}

TEST(RenderTest, DeclarationsSeparatedByBlankLine)
{
    DeclarationSet set;
    set.root_name = "DefaultType";
    set.declarations.push_back(Declaration{
        .name = "DefaultType_0",
        .body = object({FieldExpr{.name = "amount", .optional = false, .type = primitive("number")},
                        FieldExpr{.name = "currency", .optional = false, .type = primitive("string")}}),
        .fingerprint = "sha256:" + std::string(64, 'a'),
        .references = 1,
        .shared = true});
    set.declarations.push_back(Declaration{
        .name = "DefaultType",
        .body = object({FieldExpr{.name = "payments", .optional = false, .type = array_of(reference("DefaultType_0"))}}),
        .fingerprint = "sha256:" + std::string(64, 'b'),
        .references = 0,
        .shared = false});

    EXPECT_EQ(render_typescript(set),
              "type DefaultType_0 = {\n"
              "  amount: number;\n"
              "  currency: string;\n"
              "};\n"
              "\n"
              "type DefaultType = {\n"
              "  payments: DefaultType_0[];\n"
              "};\n");
}

TEST(RenderTest, PrimitiveRootDeclaration)
{
    DeclarationSet set;
    set.root_name = "Value";
    set.declarations.push_back(Declaration{.name = "Value", .body = primitive("boolean")});
    EXPECT_EQ(render_typescript(set), "type Value = boolean;\n");
}

TEST(RenderTest, TypeExprToJson)
{
    TypeExpr alternatives{.kind = ExprKind::kUnion};
    alternatives.items.push_back(primitive("number"));
    alternatives.items.push_back(reference("Root_0"));
    const TypeExpr expr = object({FieldExpr{.name = "v", .optional = true, .type = array_of(alternatives)}});

    const nlohmann::json j = type_expr_to_json(expr);
    EXPECT_EQ(j.at("kind"), "object");
    const auto& v = j.at("fields").at(0);
    EXPECT_EQ(v.at("name"), "v");
    EXPECT_EQ(v.at("optional"), true);
    EXPECT_EQ(v.at("type").at("kind"), "array");
    const auto& members = v.at("type").at("element").at("members");
    ASSERT_EQ(members.size(), 2U);
    EXPECT_EQ(members[0], (nlohmann::json{{"kind", "primitive"}, {"name", "number"}}));
    EXPECT_EQ(members[1], (nlohmann::json{{"kind", "reference"}, {"name", "Root_0"}}));
    EXPECT_FALSE(type_expr_to_json(TypeExpr{.kind = ExprKind::kAny}).contains("name"));
}

TEST(RenderTest, ManifestHeader)
{
    DeclarationSet set;
    set.root_name = "Value";
    set.squash = false;
    set.declarations.push_back(Declaration{.name = "Value", .body = primitive("null")});

    const nlohmann::json manifest = to_manifest(set);
    EXPECT_EQ(manifest.at("schema_version"), "declarations.v1");
    EXPECT_EQ(manifest.at("tool").at("name"), "jsonts");
    EXPECT_EQ(manifest.at("root"), "Value");
    EXPECT_EQ(manifest.at("squash"), false);
    ASSERT_EQ(manifest.at("declarations").size(), 1U);
    EXPECT_EQ(manifest.at("declarations").at(0).at("shared"), false);
}

}  // namespace jsonts::render::test

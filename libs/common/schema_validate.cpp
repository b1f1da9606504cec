/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 *
 * valijson's draft-07 parser resolves `#/definitions/...` only, so schema
 * documents are rewritten from `$defs` before they are handed to it.
 */

#include "jsonts/schema_validate.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <string_view>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace jsonts::common {

namespace {

constexpr std::string_view kDefsRefPrefix = "#/$defs/";

void rewrite_defs(nlohmann::json& schema)
{
    if (schema.is_array()) {
        for (auto& item : schema) {
            rewrite_defs(item);
        }
        return;
    }
    if (!schema.is_object()) {
        return;
    }
    if (auto defs = schema.find("$defs"); defs != schema.end() && !schema.contains("definitions")) {
        schema["definitions"] = *defs;
    }
    for (auto& [key, value] : schema.items()) {
        if (key == "$ref" && value.is_string()) {
            const auto& ref = value.get_ref<const std::string&>();
            if (ref.starts_with(kDefsRefPrefix)) {
                value = std::format("#/definitions/{}", ref.substr(kDefsRefPrefix.size()));
            }
            continue;
        }
        rewrite_defs(value);
    }
}

[[nodiscard]] jsonts::Result<nlohmann::json> load_schema_document(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", "Failed to open schema file: " + path.string()));
    }
    nlohmann::json document;
    try {
        in >> document;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make("SchemaParseFailed",
                        std::format("Failed to parse schema JSON {}: {}", path.string(), ex.what())));
    }
    rewrite_defs(document);
    return document;
}

[[nodiscard]] std::string describe_errors(valijson::ValidationResults& results)
{
    std::string text;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string pointer;
        for (const auto& part : error.context) {
            pointer += "/" + part;
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description);
    }
    return text.empty() ? std::string("Schema validation failed.") : text;
}

}  // namespace

jsonts::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto schema_json = load_schema_document(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    // Schemas are self-contained; a reference to another document fails the build.
    valijson::Schema schema;
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::format("Failed to build schema {}: {}", schema_path, ex.what())));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target(j);
    if (!validator.validate(schema, target, &results)) {
        return std::unexpected(Error::make("SchemaValidationFailed", describe_errors(results)));
    }
    return {};
}

}  // namespace jsonts::common

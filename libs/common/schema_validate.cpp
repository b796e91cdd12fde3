/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "axiom/schema_validate.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace axiom::common {

namespace {

constexpr std::string_view kSchemaUriPrefix = "axiom:schema/";

/// valijson understands draft-07 "definitions", our schemas are written with "$defs"
void rewrite_defs(nlohmann::json& schema)
{
    if (schema.is_object()) {
        if (schema.contains("$defs") && !schema.contains("definitions")) {
            schema["definitions"] = schema["$defs"];
        }
        for (auto& [key, value] : schema.items()) {
            if (key == "$ref" && value.is_string()) {
                auto ref = value.get<std::string>();
                constexpr std::string_view kDefsPrefix = "#/$defs/";
                if (ref.starts_with(kDefsPrefix)) {
                    value = "#/definitions/" + ref.substr(kDefsPrefix.size());
                }
                continue;
            }
            rewrite_defs(value);
        }
        return;
    }
    if (schema.is_array()) {
        for (auto& value : schema) {
            rewrite_defs(value);
        }
    }
}

[[nodiscard]] axiom::Result<nlohmann::json> load_schema_document(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make(errc::kIO, "Failed to open schema file: " + path.string()));
    }
    try {
        nlohmann::json schema = nlohmann::json::parse(in);
        rewrite_defs(schema);
        return schema;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(
            errc::kParse, std::format("Failed to parse schema {}: {}", path.string(), ex.what())));
    }
}

[[nodiscard]] std::string describe_errors(valijson::ValidationResults& results)
{
    std::string out;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string pointer;
        for (const auto& part : error.context) {
            pointer += "/" + part;
        }
        if (!out.empty()) {
            out += '\n';
        }
        out += std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description);
    }
    return out;
}

}  // namespace

axiom::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto schema_json = load_schema_document(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    const auto schema_dir = std::filesystem::path(schema_path).parent_path();
    std::vector<std::unique_ptr<nlohmann::json>> referenced;
    const auto fetch_doc = [&schema_dir, &referenced](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        auto doc = load_schema_document(schema_dir
                                        / (uri.substr(kSchemaUriPrefix.size()) + ".schema.json"));
        if (!doc) {
            return nullptr;
        }
        referenced.push_back(std::make_unique<nlohmann::json>(std::move(*doc)));
        return referenced.back().get();
    };
    const auto free_doc = [](const nlohmann::json*) {};

    valijson::Schema schema;
    valijson::SchemaParser parser;
    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema, fetch_doc, free_doc);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make(errc::kParse, std::format("Failed to build schema {}: {}", schema_path, ex.what())));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target(j);
    if (!validator.validate(schema, target, &results)) {
        std::string message = describe_errors(results);
        if (message.empty()) {
            message = "Schema validation failed.";
        }
        return std::unexpected(Error::make(errc::kValidation, std::move(message)));
    }
    return {};
}

}  // namespace axiom::common

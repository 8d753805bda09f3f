#pragma once
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpcore {

enum class FieldType {
    String, Integer, Number, Boolean, Object, Array, Null, Any
};

std::string field_type_to_string(FieldType type);
/// Throws SchemaError for names outside the JSON Schema primitive set.
FieldType field_type_from_string(const std::string& s);

/// True if `value` is acceptable for `type`. Integral doubles count as integers.
bool value_matches(const nlohmann::json& value, FieldType type);

struct FieldSpec {
    std::string name;
    std::vector<FieldType> types;   // empty means any type
    bool required = false;
    std::optional<std::string> description;
    std::optional<std::vector<nlohmann::json>> enum_values;

    bool operator==(const FieldSpec& o) const {
        return name == o.name && types == o.types && required == o.required
               && description == o.description && enum_values == o.enum_values;
    }
};

/// Structural view of a tool's JSON Schema: the named top-level fields of the
/// argument object, their primitive types and whether they are required.
/// Nested schemas are only checked for their top-level type.
class InputSchema {
public:
    /// Accepts any argument object.
    InputSchema() = default;

    /// Compile a JSON Schema object. Throws SchemaError if it is not an
    /// object schema or uses an unknown type name.
    [[nodiscard]] static InputSchema compile(const nlohmann::json& schema);

    /// Returns one message per problem; empty when `arguments` is valid.
    [[nodiscard]] std::vector<std::string> validate(const nlohmann::json& arguments) const;

    /// Throws ValidationError listing every problem.
    void check(const nlohmann::json& arguments) const;

    [[nodiscard]] const std::vector<FieldSpec>& fields() const { return fields_; }
    [[nodiscard]] const FieldSpec* field(const std::string& name) const;
    [[nodiscard]] bool additional_properties() const { return additional_properties_; }

private:
    std::vector<FieldSpec> fields_;
    bool additional_properties_ = true;
};

/// Builds the JSON Schema for a tool's input in registration code.
///
///   def.input_schema = SchemaBuilder()
///       .required("message", FieldType::String, "Message to echo back")
///       .build();
class SchemaBuilder {
public:
    SchemaBuilder& required(const std::string& name, FieldType type,
                            std::optional<std::string> description = std::nullopt);
    SchemaBuilder& optional(const std::string& name, FieldType type,
                            std::optional<std::string> description = std::nullopt);
    SchemaBuilder& one_of(const std::string& name, std::vector<std::string> values,
                          bool required = true,
                          std::optional<std::string> description = std::nullopt);
    SchemaBuilder& additional_properties(bool allowed);

    [[nodiscard]] nlohmann::json build() const;

private:
    SchemaBuilder& add(const std::string& name, nlohmann::json property, bool required);

    nlohmann::json properties_ = nlohmann::json::object();
    std::vector<std::string> required_;
    std::optional<bool> additional_properties_;
};

/// Problems with prompt arguments: each required argument present, every
/// supplied value a string.
[[nodiscard]] std::vector<std::string> validate_prompt_arguments(const PromptDefinition& def,
                                                                 const nlohmann::json& arguments);

} // namespace mcpcore

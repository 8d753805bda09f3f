#include "mcpcore/schema.hpp"
#include "mcpcore/error.hpp"
#include <algorithm>
#include <cmath>

namespace mcpcore {

std::string field_type_to_string(FieldType type) {
    switch (type) {
        case FieldType::String:  return "string";
        case FieldType::Integer: return "integer";
        case FieldType::Number:  return "number";
        case FieldType::Boolean: return "boolean";
        case FieldType::Object:  return "object";
        case FieldType::Array:   return "array";
        case FieldType::Null:    return "null";
        default:                 return "any";
    }
}

FieldType field_type_from_string(const std::string& s) {
    if (s == "string")  return FieldType::String;
    if (s == "integer") return FieldType::Integer;
    if (s == "number")  return FieldType::Number;
    if (s == "boolean") return FieldType::Boolean;
    if (s == "object")  return FieldType::Object;
    if (s == "array")   return FieldType::Array;
    if (s == "null")    return FieldType::Null;
    throw SchemaError("Unknown schema type: " + s);
}

bool value_matches(const nlohmann::json& value, FieldType type) {
    switch (type) {
        case FieldType::String:  return value.is_string();
        case FieldType::Integer:
            if (value.is_number_integer()) return true;
            if (value.is_number_float()) {
                double d = value.get<double>();
                return std::isfinite(d) && std::floor(d) == d;
            }
            return false;
        case FieldType::Number:  return value.is_number();
        case FieldType::Boolean: return value.is_boolean();
        case FieldType::Object:  return value.is_object();
        case FieldType::Array:   return value.is_array();
        case FieldType::Null:    return value.is_null();
        case FieldType::Any:     return true;
    }
    return false;
}

namespace {

std::vector<FieldType> parse_types(const std::string& field, const nlohmann::json& property) {
    std::vector<FieldType> types;
    if (!property.contains("type")) return types;

    const auto& t = property.at("type");
    if (t.is_string()) {
        types.push_back(field_type_from_string(t.get<std::string>()));
    } else if (t.is_array()) {
        for (const auto& item : t) {
            if (!item.is_string()) {
                throw SchemaError("Property '" + field + "' has a non-string type entry");
            }
            types.push_back(field_type_from_string(item.get<std::string>()));
        }
    } else {
        throw SchemaError("Property '" + field + "' has an invalid 'type'");
    }
    return types;
}

std::string describe_types(const std::vector<FieldType>& types) {
    std::string out;
    for (size_t i = 0; i < types.size(); ++i) {
        if (i > 0) out += " or ";
        out += field_type_to_string(types[i]);
    }
    return out;
}

} // anonymous namespace

InputSchema InputSchema::compile(const nlohmann::json& schema) {
    if (!schema.is_object()) {
        throw SchemaError("Input schema must be a JSON object");
    }
    if (schema.contains("type")) {
        const auto& t = schema.at("type");
        if (!t.is_string() || t.get<std::string>() != "object") {
            throw SchemaError("Input schema must describe an object");
        }
    }

    InputSchema out;

    if (schema.contains("properties")) {
        const auto& props = schema.at("properties");
        if (!props.is_object()) {
            throw SchemaError("'properties' must be an object");
        }
        for (auto it = props.begin(); it != props.end(); ++it) {
            if (!it.value().is_object()) {
                throw SchemaError("Property '" + it.key() + "' must be a schema object");
            }
            FieldSpec spec;
            spec.name = it.key();
            spec.types = parse_types(it.key(), it.value());
            if (it.value().contains("description") && it.value().at("description").is_string()) {
                spec.description = it.value().at("description").get<std::string>();
            }
            if (it.value().contains("enum")) {
                const auto& values = it.value().at("enum");
                if (!values.is_array() || values.empty()) {
                    throw SchemaError("Property '" + it.key() + "' has an empty or invalid 'enum'");
                }
                spec.enum_values = values.get<std::vector<nlohmann::json>>();
            }
            out.fields_.push_back(std::move(spec));
        }
    }

    if (schema.contains("required")) {
        const auto& req = schema.at("required");
        if (!req.is_array()) {
            throw SchemaError("'required' must be an array of field names");
        }
        for (const auto& name_j : req) {
            if (!name_j.is_string()) {
                throw SchemaError("'required' must be an array of field names");
            }
            std::string name = name_j.get<std::string>();
            auto it = std::find_if(out.fields_.begin(), out.fields_.end(),
                [&name](const FieldSpec& f) { return f.name == name; });
            if (it != out.fields_.end()) {
                it->required = true;
            } else {
                // Required but undeclared: any type is accepted.
                FieldSpec spec;
                spec.name = name;
                spec.required = true;
                out.fields_.push_back(std::move(spec));
            }
        }
    }

    if (schema.contains("additionalProperties")) {
        const auto& ap = schema.at("additionalProperties");
        // A sub-schema still permits extra fields; only `false` forbids them.
        out.additional_properties_ = !(ap.is_boolean() && !ap.get<bool>());
    }

    return out;
}

const FieldSpec* InputSchema::field(const std::string& name) const {
    auto it = std::find_if(fields_.begin(), fields_.end(),
        [&name](const FieldSpec& f) { return f.name == name; });
    return it == fields_.end() ? nullptr : &*it;
}

std::vector<std::string> InputSchema::validate(const nlohmann::json& arguments) const {
    std::vector<std::string> problems;
    if (!arguments.is_object()) {
        problems.push_back(std::string("arguments must be an object, got ") + arguments.type_name());
        return problems;
    }

    for (const auto& f : fields_) {
        auto it = arguments.find(f.name);
        if (it == arguments.end()) {
            if (f.required) problems.push_back("missing required field '" + f.name + "'");
            continue;
        }
        if (!f.types.empty()) {
            bool ok = std::any_of(f.types.begin(), f.types.end(),
                [&it](FieldType t) { return value_matches(*it, t); });
            if (!ok) {
                problems.push_back("field '" + f.name + "' must be " + describe_types(f.types)
                                   + ", got " + it->type_name());
                continue;
            }
        }
        if (f.enum_values) {
            const auto& allowed = *f.enum_values;
            if (std::find(allowed.begin(), allowed.end(), *it) == allowed.end()) {
                problems.push_back("field '" + f.name + "' must be one of "
                                   + nlohmann::json(allowed).dump());
            }
        }
    }

    if (!additional_properties_) {
        for (auto it = arguments.begin(); it != arguments.end(); ++it) {
            if (!field(it.key())) {
                problems.push_back("unexpected field '" + it.key() + "'");
            }
        }
    }
    return problems;
}

void InputSchema::check(const nlohmann::json& arguments) const {
    auto problems = validate(arguments);
    if (!problems.empty()) {
        throw ValidationError(std::move(problems));
    }
}

// ---------- SchemaBuilder ----------

SchemaBuilder& SchemaBuilder::add(const std::string& name, nlohmann::json property, bool required) {
    properties_[name] = std::move(property);
    auto it = std::find(required_.begin(), required_.end(), name);
    if (required && it == required_.end()) {
        required_.push_back(name);
    } else if (!required && it != required_.end()) {
        required_.erase(it);
    }
    return *this;
}

SchemaBuilder& SchemaBuilder::required(const std::string& name, FieldType type,
                                       std::optional<std::string> description) {
    nlohmann::json prop = nlohmann::json::object();
    if (type != FieldType::Any) prop["type"] = field_type_to_string(type);
    if (description) prop["description"] = *description;
    return add(name, std::move(prop), true);
}

SchemaBuilder& SchemaBuilder::optional(const std::string& name, FieldType type,
                                       std::optional<std::string> description) {
    nlohmann::json prop = nlohmann::json::object();
    if (type != FieldType::Any) prop["type"] = field_type_to_string(type);
    if (description) prop["description"] = *description;
    return add(name, std::move(prop), false);
}

SchemaBuilder& SchemaBuilder::one_of(const std::string& name, std::vector<std::string> values,
                                     bool required, std::optional<std::string> description) {
    nlohmann::json prop = {{"type", "string"}, {"enum", values}};
    if (description) prop["description"] = *description;
    return add(name, std::move(prop), required);
}

SchemaBuilder& SchemaBuilder::additional_properties(bool allowed) {
    additional_properties_ = allowed;
    return *this;
}

nlohmann::json SchemaBuilder::build() const {
    nlohmann::json schema = {{"type", "object"}, {"properties", properties_}};
    if (!required_.empty()) schema["required"] = required_;
    if (additional_properties_) schema["additionalProperties"] = *additional_properties_;
    return schema;
}

// ---------- Prompt arguments ----------

std::vector<std::string> validate_prompt_arguments(const PromptDefinition& def,
                                                   const nlohmann::json& arguments) {
    std::vector<std::string> problems;
    if (!arguments.is_object()) {
        problems.push_back(std::string("arguments must be an object, got ") + arguments.type_name());
        return problems;
    }
    for (const auto& arg : def.arguments) {
        if (arg.required && !arguments.contains(arg.name)) {
            problems.push_back("missing required argument '" + arg.name + "'");
        }
    }
    for (auto it = arguments.begin(); it != arguments.end(); ++it) {
        if (!it.value().is_string()) {
            problems.push_back("argument '" + it.key() + "' must be string, got "
                               + it.value().type_name());
        }
    }
    return problems;
}

} // namespace mcpcore

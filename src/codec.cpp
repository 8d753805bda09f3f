#include "mcpcore/codec.hpp"
#include "mcpcore/error.hpp"
#include "mcpcore/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <optional>
#include <stdexcept>
#include <string>

namespace mcpcore {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            switch (val.get_number_type()) {
                case simdjson::ondemand::number_type::signed_integer:
                    return nlohmann::json(int64_t(val.get_int64()));
                case simdjson::ondemand::number_type::unsigned_integer:
                    return nlohmann::json(uint64_t(val.get_uint64()));
                default:
                    return nlohmann::json(double(val.get_double()));
            }
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(bool(val.get_bool()));
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            throw McpParseError("Unexpected JSON value");
    }
}

McpParseError invalid_request(const std::string& msg) {
    return McpParseError(msg, error::InvalidRequest);
}

RequestId parse_id(const nlohmann::json& j) {
    RequestId id;
    try {
        from_json(j, id);
    } catch (const std::invalid_argument& e) {
        throw invalid_request(e.what());
    }
    return id;
}

} // anonymous namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        throw invalid_request("Missing 'jsonrpc' field");
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        throw invalid_request("Invalid jsonrpc version, expected '2.0'");
    }

    auto method = j.find("method");
    if (method != j.end() && !method->is_string()) {
        throw invalid_request("'method' must be a string");
    }
    auto params = j.find("params");
    if (params != j.end() && !params->is_object() && !params->is_array()) {
        throw invalid_request("'params' must be an object or array");
    }
    auto id = j.find("id");
    std::optional<nlohmann::json> params_value;
    if (params != j.end()) params_value = *params;

    if (method != j.end()) {
        if (id == j.end()) {
            return JsonRpcNotification{method->get<std::string>(), std::move(params_value)};
        }
        return JsonRpcRequest{parse_id(*id), method->get<std::string>(), std::move(params_value)};
    }

    if (id == j.end()) {
        throw invalid_request("Cannot determine message type: missing both 'id' and 'method'");
    }
    auto result = j.find("result");
    auto err = j.find("error");
    if ((result == j.end()) == (err == j.end())) {
        throw invalid_request("Response must carry exactly one of 'result' and 'error'");
    }
    if (result != j.end()) {
        return make_result(parse_id(*id), *result);
    }
    try {
        return make_error(parse_id(*id), err->get<JsonRpcError>());
    } catch (const nlohmann::json::exception& e) {
        throw invalid_request(std::string("Malformed error object: ") + e.what());
    }
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    // simdjson requires padded input
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    simdjson::ondemand::json_type root_type;
    error = doc.type().get(root_type);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }
    if (root_type != simdjson::ondemand::json_type::object
        && root_type != simdjson::ondemand::json_type::array) {
        // Scalar documents cannot be walked as values; settle validity with nlohmann.
        if (nlohmann::json::parse(raw, nullptr, false).is_discarded()) {
            throw McpParseError("JSON parse error: invalid scalar document");
        }
        throw invalid_request("Message must be a JSON object");
    }

    // Convert to nlohmann for further processing
    nlohmann::json j;
    try {
        j = simdjson_to_nlohmann(doc.get_value().value());
        if (!doc.at_end()) {
            throw McpParseError("Trailing content after JSON document");
        }
    } catch (const McpParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw McpParseError(std::string("JSON parse error: ") + e.what());
    }

    if (j.is_array()) {
        throw invalid_request("Batch messages are not supported");
    }
    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    // Replace invalid UTF-8 rather than throwing mid-response.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<RequestId> Codec::recover_id(std::string_view raw) {
    auto j = nlohmann::json::parse(raw, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    auto it = j.find("id");
    if (it == j.end()) {
        return std::nullopt;
    }
    RequestId id;
    try {
        from_json(*it, id);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
    return id;
}

} // namespace mcpcore

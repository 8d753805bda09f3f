#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace mcpcore {

/// Speaker of a prompt message, and the audience of a content block.
enum class Role { User, Assistant };

std::string to_string(Role role);
/// Throws std::invalid_argument for anything but "user" or "assistant".
Role role_from_string(const std::string& s);

/// Optional display hints on a content block.
struct Annotations {
    std::optional<std::vector<Role>> audience;
    std::optional<double> priority;             // 0.0 .. 1.0
    std::optional<std::string> last_modified;   // ISO 8601

    bool operator==(const Annotations& o) const {
        return std::tie(audience, priority, last_modified)
               == std::tie(o.audience, o.priority, o.last_modified);
    }
};

// ---------- Content blocks ----------

enum class ContentKind { Text, Image, Audio, Resource };

/// Wire tag of a content kind: "text", "image", "audio" or "resource".
std::string to_string(ContentKind kind);
/// Throws std::invalid_argument for unknown tags.
ContentKind content_kind_from_string(const std::string& s);

struct TextContent {
    std::string text;
    std::optional<Annotations> annotations;

    bool operator==(const TextContent& o) const {
        return std::tie(text, annotations) == std::tie(o.text, o.annotations);
    }
};

/// Base64 payload with a MIME type; shared shape of image and audio blocks.
struct ImageContent {
    std::string data;
    std::string mime_type;
    std::optional<Annotations> annotations;

    bool operator==(const ImageContent& o) const {
        return std::tie(data, mime_type, annotations) == std::tie(o.data, o.mime_type, o.annotations);
    }
};

struct AudioContent {
    std::string data;
    std::string mime_type;
    std::optional<Annotations> annotations;

    bool operator==(const AudioContent& o) const {
        return std::tie(data, mime_type, annotations) == std::tie(o.data, o.mime_type, o.annotations);
    }
};

/// Inline resource contents. Exactly one of `text` and `blob` is expected.
struct EmbeddedResource {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;
    std::optional<Annotations> annotations;

    bool operator==(const EmbeddedResource& o) const {
        return std::tie(uri, mime_type, text, blob, annotations)
               == std::tie(o.uri, o.mime_type, o.text, o.blob, o.annotations);
    }
};

/// One block of a success payload; the alternative order matches ContentKind.
using Content = std::variant<TextContent, ImageContent, AudioContent, EmbeddedResource>;

ContentKind content_kind(const Content& c);

// Must precede the comparisons below, which instantiate nlohmann's
// serializer checks for Content.
void to_json(nlohmann::json& j, Role r);
void from_json(const nlohmann::json& j, Role& r);

void to_json(nlohmann::json& j, const Annotations& a);
void from_json(const nlohmann::json& j, Annotations& a);

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);
void to_json(nlohmann::json& j, const ImageContent& t);
void from_json(const nlohmann::json& j, ImageContent& t);
void to_json(nlohmann::json& j, const AudioContent& t);
void from_json(const nlohmann::json& j, AudioContent& t);
void to_json(nlohmann::json& j, const EmbeddedResource& t);
void from_json(const nlohmann::json& j, EmbeddedResource& t);

/// Dispatches on the "type" tag. Throws std::invalid_argument for unknown kinds.
void to_json(nlohmann::json& j, const Content& c);
void from_json(const nlohmann::json& j, Content& c);

// ---------- Tools ----------

struct ToolDefinition {
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    nlohmann::json input_schema = nlohmann::json{{"type", "object"}};
    std::optional<nlohmann::json> annotations;

    bool operator==(const ToolDefinition& o) const {
        return std::tie(name, title, description, input_schema, annotations)
               == std::tie(o.name, o.title, o.description, o.input_schema, o.annotations);
    }
};

/// Success payload of tools/call. `is_error` marks a failure the tool itself
/// reports; the response is still a result, not a JSON-RPC error.
struct CallToolResult {
    std::vector<Content> content;
    std::optional<nlohmann::json> structured_content;
    bool is_error = false;

    bool operator==(const CallToolResult& o) const {
        return std::tie(content, structured_content, is_error)
               == std::tie(o.content, o.structured_content, o.is_error);
    }
};

/// A result holding a single text block.
CallToolResult text_result(std::string text, bool is_error = false);

// ---------- Prompts ----------

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;

    bool operator==(const PromptArgument& o) const {
        return std::tie(name, description, required) == std::tie(o.name, o.description, o.required);
    }
};

struct PromptDefinition {
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;

    bool operator==(const PromptDefinition& o) const {
        return std::tie(name, title, description, arguments)
               == std::tie(o.name, o.title, o.description, o.arguments);
    }
};

struct PromptMessage {
    Role role = Role::User;
    Content content;

    bool operator==(const PromptMessage& o) const {
        return role == o.role && content == o.content;
    }
};

struct GetPromptResult {
    std::optional<std::string> description;
    std::vector<PromptMessage> messages;

    bool operator==(const GetPromptResult& o) const {
        return description == o.description && messages == o.messages;
    }
};

// ---------- Handshake ----------

/// Capability entry for a list the server exposes. The registry is sealed
/// before serving, so list_changed stays false in practice.
struct ListCapability {
    bool list_changed = false;

    bool operator==(const ListCapability& o) const { return list_changed == o.list_changed; }
};

struct ServerCapabilities {
    std::optional<ListCapability> tools;
    std::optional<ListCapability> prompts;

    bool operator==(const ServerCapabilities& o) const {
        return tools == o.tools && prompts == o.prompts;
    }
};

struct Implementation {
    std::string name;
    std::optional<std::string> title;
    std::string version;

    bool operator==(const Implementation& o) const {
        return std::tie(name, title, version) == std::tie(o.name, o.title, o.version);
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    bool operator==(const InitializeResult& o) const {
        return std::tie(protocol_version, capabilities, server_info, instructions)
               == std::tie(o.protocol_version, o.capabilities, o.server_info, o.instructions);
    }
};

// ---------- JSON conversion (wire names are camelCase) ----------

void to_json(nlohmann::json& j, const ToolDefinition& t);
void from_json(const nlohmann::json& j, ToolDefinition& t);
void to_json(nlohmann::json& j, const CallToolResult& t);
void from_json(const nlohmann::json& j, CallToolResult& t);

void to_json(nlohmann::json& j, const PromptArgument& t);
void from_json(const nlohmann::json& j, PromptArgument& t);
void to_json(nlohmann::json& j, const PromptDefinition& t);
void from_json(const nlohmann::json& j, PromptDefinition& t);
void to_json(nlohmann::json& j, const PromptMessage& t);
void from_json(const nlohmann::json& j, PromptMessage& t);
void to_json(nlohmann::json& j, const GetPromptResult& t);
void from_json(const nlohmann::json& j, GetPromptResult& t);

void to_json(nlohmann::json& j, const ListCapability& t);
void from_json(const nlohmann::json& j, ListCapability& t);
void to_json(nlohmann::json& j, const ServerCapabilities& t);
void from_json(const nlohmann::json& j, ServerCapabilities& t);
void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);
void to_json(nlohmann::json& j, const InitializeResult& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

} // namespace mcpcore

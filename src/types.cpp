#include "mcpcore/types.hpp"
#include <stdexcept>

namespace mcpcore {

namespace {

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

// Absent and null both leave `out` unset.
template <typename T>
void get_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->template get<T>();
    }
}

template <typename Media>
void media_to_json(nlohmann::json& j, const Media& m, ContentKind kind) {
    j = {{"type", to_string(kind)}, {"data", m.data}, {"mimeType", m.mime_type}};
    put_optional(j, "annotations", m.annotations);
}

template <typename Media>
void media_from_json(const nlohmann::json& j, Media& m) {
    j.at("data").get_to(m.data);
    j.at("mimeType").get_to(m.mime_type);
    get_optional(j, "annotations", m.annotations);
}

} // anonymous namespace

// ---------- Role ----------

std::string to_string(Role role) {
    return role == Role::Assistant ? "assistant" : "user";
}

Role role_from_string(const std::string& s) {
    if (s == "user") return Role::User;
    if (s == "assistant") return Role::Assistant;
    throw std::invalid_argument("Unknown role: " + s);
}

void to_json(nlohmann::json& j, Role r) { j = to_string(r); }

void from_json(const nlohmann::json& j, Role& r) { r = role_from_string(j.get<std::string>()); }

void to_json(nlohmann::json& j, const Annotations& a) {
    j = nlohmann::json::object();
    put_optional(j, "audience", a.audience);
    put_optional(j, "priority", a.priority);
    put_optional(j, "lastModified", a.last_modified);
}

void from_json(const nlohmann::json& j, Annotations& a) {
    get_optional(j, "audience", a.audience);
    get_optional(j, "priority", a.priority);
    get_optional(j, "lastModified", a.last_modified);
    if (a.priority && (*a.priority < 0.0 || *a.priority > 1.0)) {
        throw std::invalid_argument("annotations.priority must be within [0, 1]");
    }
}

// ---------- Content ----------

std::string to_string(ContentKind kind) {
    switch (kind) {
        case ContentKind::Text:     return "text";
        case ContentKind::Image:    return "image";
        case ContentKind::Audio:    return "audio";
        case ContentKind::Resource: return "resource";
    }
    return "text";
}

ContentKind content_kind_from_string(const std::string& s) {
    if (s == "text")     return ContentKind::Text;
    if (s == "image")    return ContentKind::Image;
    if (s == "audio")    return ContentKind::Audio;
    if (s == "resource") return ContentKind::Resource;
    throw std::invalid_argument("Unknown content type: " + s);
}

ContentKind content_kind(const Content& c) {
    return static_cast<ContentKind>(c.index());
}

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", to_string(ContentKind::Text)}, {"text", t.text}};
    put_optional(j, "annotations", t.annotations);
}

void from_json(const nlohmann::json& j, TextContent& t) {
    j.at("text").get_to(t.text);
    get_optional(j, "annotations", t.annotations);
}

void to_json(nlohmann::json& j, const ImageContent& t) { media_to_json(j, t, ContentKind::Image); }
void from_json(const nlohmann::json& j, ImageContent& t) { media_from_json(j, t); }

void to_json(nlohmann::json& j, const AudioContent& t) { media_to_json(j, t, ContentKind::Audio); }
void from_json(const nlohmann::json& j, AudioContent& t) { media_from_json(j, t); }

void to_json(nlohmann::json& j, const EmbeddedResource& t) {
    nlohmann::json resource = {{"uri", t.uri}};
    put_optional(resource, "mimeType", t.mime_type);
    put_optional(resource, "text", t.text);
    put_optional(resource, "blob", t.blob);
    j = {{"type", to_string(ContentKind::Resource)}, {"resource", std::move(resource)}};
    put_optional(j, "annotations", t.annotations);
}

void from_json(const nlohmann::json& j, EmbeddedResource& t) {
    const auto& resource = j.at("resource");
    resource.at("uri").get_to(t.uri);
    get_optional(resource, "mimeType", t.mime_type);
    get_optional(resource, "text", t.text);
    get_optional(resource, "blob", t.blob);
    get_optional(j, "annotations", t.annotations);
}

void to_json(nlohmann::json& j, const Content& c) {
    std::visit([&j](const auto& block) { to_json(j, block); }, c);
}

void from_json(const nlohmann::json& j, Content& c) {
    switch (content_kind_from_string(j.at("type").get<std::string>())) {
        case ContentKind::Text:     c = j.get<TextContent>(); break;
        case ContentKind::Image:    c = j.get<ImageContent>(); break;
        case ContentKind::Audio:    c = j.get<AudioContent>(); break;
        case ContentKind::Resource: c = j.get<EmbeddedResource>(); break;
    }
}

// ---------- Tools ----------

CallToolResult text_result(std::string text, bool is_error) {
    CallToolResult result;
    result.content.emplace_back(TextContent{std::move(text), std::nullopt});
    result.is_error = is_error;
    return result;
}

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"inputSchema", t.input_schema}};
    put_optional(j, "title", t.title);
    put_optional(j, "description", t.description);
    put_optional(j, "annotations", t.annotations);
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    j.at("name").get_to(t.name);
    t.input_schema = j.at("inputSchema");
    get_optional(j, "title", t.title);
    get_optional(j, "description", t.description);
    get_optional(j, "annotations", t.annotations);
}

void to_json(nlohmann::json& j, const CallToolResult& t) {
    nlohmann::json blocks = nlohmann::json::array();
    for (const auto& c : t.content) {
        blocks.push_back(c);
    }
    j = {{"content", std::move(blocks)}};
    put_optional(j, "structuredContent", t.structured_content);
    // Omitted unless set.
    if (t.is_error) j["isError"] = true;
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    t.content.clear();
    if (auto it = j.find("content"); it != j.end()) {
        for (const auto& block : *it) {
            t.content.push_back(block.get<Content>());
        }
    }
    get_optional(j, "structuredContent", t.structured_content);
    t.is_error = j.value("isError", false);
}

// ---------- Prompts ----------

void to_json(nlohmann::json& j, const PromptArgument& t) {
    j = {{"name", t.name}, {"required", t.required}};
    put_optional(j, "description", t.description);
}

void from_json(const nlohmann::json& j, PromptArgument& t) {
    j.at("name").get_to(t.name);
    get_optional(j, "description", t.description);
    t.required = j.value("required", false);
}

void to_json(nlohmann::json& j, const PromptDefinition& t) {
    j = {{"name", t.name}, {"arguments", t.arguments}};
    put_optional(j, "title", t.title);
    put_optional(j, "description", t.description);
}

void from_json(const nlohmann::json& j, PromptDefinition& t) {
    j.at("name").get_to(t.name);
    get_optional(j, "title", t.title);
    get_optional(j, "description", t.description);
    t.arguments = j.value("arguments", std::vector<PromptArgument>{});
}

void to_json(nlohmann::json& j, const PromptMessage& t) {
    j = {{"role", t.role}, {"content", t.content}};
}

void from_json(const nlohmann::json& j, PromptMessage& t) {
    j.at("role").get_to(t.role);
    j.at("content").get_to(t.content);
}

void to_json(nlohmann::json& j, const GetPromptResult& t) {
    j = {{"messages", t.messages}};
    put_optional(j, "description", t.description);
}

void from_json(const nlohmann::json& j, GetPromptResult& t) {
    get_optional(j, "description", t.description);
    j.at("messages").get_to(t.messages);
}

// ---------- Handshake ----------

void to_json(nlohmann::json& j, const ListCapability& t) {
    j = {{"listChanged", t.list_changed}};
}

void from_json(const nlohmann::json& j, ListCapability& t) {
    t.list_changed = j.value("listChanged", false);
}

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    put_optional(j, "tools", t.tools);
    put_optional(j, "prompts", t.prompts);
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    get_optional(j, "tools", t.tools);
    get_optional(j, "prompts", t.prompts);
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
    put_optional(j, "title", t.title);
}

void from_json(const nlohmann::json& j, Implementation& t) {
    j.at("name").get_to(t.name);
    j.at("version").get_to(t.version);
    get_optional(j, "title", t.title);
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info},
    };
    put_optional(j, "instructions", t.instructions);
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    j.at("protocolVersion").get_to(t.protocol_version);
    j.at("capabilities").get_to(t.capabilities);
    j.at("serverInfo").get_to(t.server_info);
    get_optional(j, "instructions", t.instructions);
}

} // namespace mcpcore

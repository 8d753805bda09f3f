#include "mcpcore/registry.hpp"
#include "mcpcore/error.hpp"
#include "mcpcore/logging.hpp"
#include <unordered_set>

namespace mcpcore {

void Registry::check_open() const {
    if (sealed_) {
        throw RegistrySealedError();
    }
}

void Registry::add_tool(ToolDefinition def, ToolHandler handler) {
    if (!handler) {
        throw std::invalid_argument("Tool handler must not be empty: " + def.name);
    }
    add_tool(std::move(def),
        ContextToolHandler([h = std::move(handler)](const nlohmann::json& args,
                                                    const RequestContext&) {
            return h(args);
        }));
}

void Registry::add_tool(ToolDefinition def, ContextToolHandler handler) {
    check_open();
    if (def.name.empty()) {
        throw SchemaError("Tool name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler must not be empty: " + def.name);
    }
    if (tool_index_.count(def.name) > 0) {
        throw DuplicateNameError("Tool", def.name);
    }

    InputSchema schema = InputSchema::compile(def.input_schema);
    logging::get()->debug("Registered tool '{}' ({} fields)", def.name, schema.fields().size());

    tool_index_.emplace(def.name, tools_.size());
    tools_.push_back(ToolEntry{std::move(def), std::move(schema), std::move(handler)});
}

void Registry::add_prompt(PromptDefinition def, PromptHandler handler) {
    check_open();
    if (def.name.empty()) {
        throw SchemaError("Prompt name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Prompt handler must not be empty: " + def.name);
    }
    if (prompt_index_.count(def.name) > 0) {
        throw DuplicateNameError("Prompt", def.name);
    }

    std::unordered_set<std::string> seen;
    for (const auto& arg : def.arguments) {
        if (!seen.insert(arg.name).second) {
            throw SchemaError("Prompt '" + def.name + "' declares argument '"
                              + arg.name + "' twice");
        }
    }
    logging::get()->debug("Registered prompt '{}' ({} arguments)", def.name, def.arguments.size());

    prompt_index_.emplace(def.name, prompts_.size());
    prompts_.push_back(PromptEntry{std::move(def), std::move(handler)});
}

std::vector<ToolDefinition> Registry::list_tools() const {
    std::vector<ToolDefinition> out;
    out.reserve(tools_.size());
    for (const auto& entry : tools_) {
        out.push_back(entry.definition);
    }
    return out;
}

std::vector<PromptDefinition> Registry::list_prompts() const {
    std::vector<PromptDefinition> out;
    out.reserve(prompts_.size());
    for (const auto& entry : prompts_) {
        out.push_back(entry.definition);
    }
    return out;
}

const ToolEntry* Registry::find_tool(const std::string& name) const {
    auto it = tool_index_.find(name);
    return it == tool_index_.end() ? nullptr : &tools_[it->second];
}

const PromptEntry* Registry::find_prompt(const std::string& name) const {
    auto it = prompt_index_.find(name);
    return it == prompt_index_.end() ? nullptr : &prompts_[it->second];
}

const ToolEntry& Registry::resolve_tool(const std::string& name) const {
    const ToolEntry* entry = find_tool(name);
    if (!entry) {
        throw NotFoundError("Tool", name);
    }
    return *entry;
}

const PromptEntry& Registry::resolve_prompt(const std::string& name) const {
    const PromptEntry* entry = find_prompt(name);
    if (!entry) {
        throw NotFoundError("Prompt", name);
    }
    return *entry;
}

} // namespace mcpcore

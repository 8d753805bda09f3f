#pragma once
#include "types.hpp"
#include "schema.hpp"
#include "cancellation.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpcore {

/// Callback types
using ToolHandler = std::function<CallToolResult(const nlohmann::json& arguments)>;
using ContextToolHandler = std::function<CallToolResult(const nlohmann::json& arguments,
                                                        const RequestContext& ctx)>;
using PromptHandler = std::function<GetPromptResult(const std::string& name,
                                                    const nlohmann::json& arguments)>;

struct ToolEntry {
    ToolDefinition definition;
    InputSchema schema;
    ContextToolHandler handler;
};

struct PromptEntry {
    PromptDefinition definition;
    PromptHandler handler;
};

/// Declared tools and prompts, keyed by name, in registration order.
///
/// Populated once at startup and sealed before serving; after seal() it is
/// never mutated, so concurrent readers need no locking.
class Registry {
public:
    // ---- Registration ----
    void add_tool(ToolDefinition def, ToolHandler handler);
    void add_tool(ToolDefinition def, ContextToolHandler handler);
    void add_prompt(PromptDefinition def, PromptHandler handler);

    /// Freeze the registry. Further add_* calls throw RegistrySealedError.
    void seal() { sealed_ = true; }
    [[nodiscard]] bool sealed() const { return sealed_; }

    // ---- Discovery ----
    [[nodiscard]] std::vector<ToolDefinition> list_tools() const;
    [[nodiscard]] std::vector<PromptDefinition> list_prompts() const;

    // ---- Lookup ----
    /// Throws NotFoundError.
    [[nodiscard]] const ToolEntry& resolve_tool(const std::string& name) const;
    [[nodiscard]] const PromptEntry& resolve_prompt(const std::string& name) const;

    [[nodiscard]] const ToolEntry* find_tool(const std::string& name) const;
    [[nodiscard]] const PromptEntry* find_prompt(const std::string& name) const;

    [[nodiscard]] size_t tool_count() const { return tools_.size(); }
    [[nodiscard]] size_t prompt_count() const { return prompts_.size(); }

private:
    void check_open() const;

    bool sealed_ = false;
    std::vector<ToolEntry> tools_;
    std::unordered_map<std::string, size_t> tool_index_;
    std::vector<PromptEntry> prompts_;
    std::unordered_map<std::string, size_t> prompt_index_;
};

} // namespace mcpcore

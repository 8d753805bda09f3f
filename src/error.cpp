#include "mcpcore/error.hpp"

namespace mcpcore {

namespace {

std::string join_problems(const std::vector<std::string>& problems) {
    std::string msg = "Invalid arguments";
    for (size_t i = 0; i < problems.size(); ++i) {
        msg += (i == 0) ? ": " : "; ";
        msg += problems[i];
    }
    return msg;
}

} // anonymous namespace

ValidationError::ValidationError(std::vector<std::string> problems)
    : McpError(join_problems(problems)), problems(std::move(problems)) {}

} // namespace mcpcore

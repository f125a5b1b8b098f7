#include "mcpipe/client/tool_catalog.hpp"
#include "mcpipe/log/logger.hpp"

#include <algorithm>
#include <unordered_set>

namespace mcpipe {

ToolCatalog::ToolCatalog(std::vector<ToolDescriptor> tools) {
    std::unordered_set<std::string> seen;
    tools_.reserve(tools.size());
    for (auto& tool : tools) {
        if (tool.name.empty()) {
            MCPIPE_LOG_WARN("Ignoring tool without a name");
            continue;
        }
        if (seen.insert(tool.name).second == false) {
            MCPIPE_LOG_WARN("Ignoring duplicate tool: " + tool.name);
            continue;
        }
        tools_.push_back(std::move(tool));
    }
}

const ToolDescriptor* ToolCatalog::find(std::string_view name) const noexcept {
    auto it = std::find_if(tools_.begin(), tools_.end(),
                           [name](const ToolDescriptor& t) { return t.name == name; });
    return it == tools_.end() ? nullptr : &*it;
}

std::vector<std::string> ToolCatalog::names() const {
    std::vector<std::string> out;
    out.reserve(tools_.size());
    for (const auto& tool : tools_) {
        out.push_back(tool.name);
    }
    return out;
}

}  // namespace mcpipe

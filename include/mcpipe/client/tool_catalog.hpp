#pragma once

#include "mcpipe/protocol/mcp_types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mcpipe {

/// Tools discovered during the handshake, in server order. Immutable once
/// built; a refresh builds a new catalog and swaps it in whole.
class ToolCatalog {
public:
    ToolCatalog() = default;

    /// Later duplicates of a name are dropped with a warning
    explicit ToolCatalog(std::vector<ToolDescriptor> tools);

    [[nodiscard]] const std::vector<ToolDescriptor>& tools() const noexcept { return tools_; }

    [[nodiscard]] const ToolDescriptor* find(std::string_view name) const noexcept;

    [[nodiscard]] bool contains(std::string_view name) const noexcept { return find(name) != nullptr; }

    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] std::size_t size() const noexcept { return tools_.size(); }
    [[nodiscard]] bool empty() const noexcept { return tools_.empty(); }

private:
    std::vector<ToolDescriptor> tools_;
};

}  // namespace mcpipe
